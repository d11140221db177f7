#pragma once

#include <memory>

namespace stockroom::core {
class ProductStore;
class StockLedger;
class SaleProcessor;
class PurchaseOrders;
class ShiftRegister;
class IntegrityGuard;
} // namespace stockroom::core
namespace stockroom::db {
class Repository;
}
namespace stockroom::identity {
class IdentityProvider;
}
namespace stockroom::notify {
class Notifier;
}

namespace stockroom::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<stockroom::core::ProductStore>   products;
  std::shared_ptr<stockroom::core::StockLedger>    ledger;
  std::shared_ptr<stockroom::core::SaleProcessor>  sales;
  std::shared_ptr<stockroom::core::PurchaseOrders> purchase_orders;
  std::shared_ptr<stockroom::core::ShiftRegister>  shifts;
  std::shared_ptr<stockroom::core::IntegrityGuard> guard;

  std::shared_ptr<stockroom::db::Repository>             repository;
  std::shared_ptr<stockroom::identity::IdentityProvider> identity;
  std::shared_ptr<stockroom::notify::Notifier>           notifier;
};

} // namespace stockroom::service
