#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/core_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/service/inventory_service.hpp"
#include "internal/service/procurement_service.hpp"
#include "internal/service/sales_service.hpp"

namespace stockroom::factory {

/*
  Application

  Owns all long-lived objects. Everything here lives for the lifetime of
  the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<identity::IdentityProvider> identity;
  std::shared_ptr<notify::Notifier>           notifier;

  std::shared_ptr<service::InventoryService>   inventory;
  std::shared_ptr<service::SalesService>       sales;
  std::shared_ptr<service::ProcurementService> procurement;
};

/*
  Build

  Constructs the whole application from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const stockroom::runtime::config::RuntimeConfig& config);

// Wires core components and services around an existing repository.
Application Assemble(std::shared_ptr<db::Repository> repository, std::shared_ptr<identity::IdentityProvider> identity,
                     std::shared_ptr<notify::NotificationSink> sink, core::InventorySettings settings);

} // namespace stockroom::factory
