#pragma once

#include <memory>
#include <string>

#include "internal/model/types.hpp"

namespace stockroom::db {
class Repository;
}
namespace stockroom::identity {
class IdentityProvider;
}
namespace stockroom::notify {
class Notifier;
}

namespace stockroom::core {

struct InventorySettings {
  model::Quantity default_low_stock_threshold = 5;
  std::string     restored_category_name      = "Restored";
};

/*
  Collaborators shared by the core components.
*/
struct CoreContext {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<identity::IdentityProvider> identity;
  std::shared_ptr<notify::Notifier>           notifier;
  InventorySettings                           settings;
};

} // namespace stockroom::core
