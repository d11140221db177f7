#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/core/product_store.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/notify/notifier.hpp"

namespace stockroom::testing {

class RecordingSink final : public notify::NotificationSink {
 public:
  void Deliver(const model::Notification& notification) override {
    delivered.push_back(notification);
  }

  std::vector<model::Notification> delivered;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

/*
  Memory-backed core context for one tenant ("shop-1", actor Alex).
*/
struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repository = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<identity::StaticIdentity> identity = std::make_shared<identity::StaticIdentity>("shop-1", identity::Actor{"user-1", "Alex"});
  std::shared_ptr<RecordingSink>            sink     = std::make_shared<RecordingSink>();
  std::shared_ptr<notify::Notifier>         notifier = std::make_shared<notify::Notifier>(repository, sink);
  core::CoreContext                         ctx;

  Fixture() {
    ctx.repository = repository;
    ctx.identity   = identity;
    ctx.notifier   = notifier;
  }

  // Variant-less product brought to `stock` through the ledger.
  model::Product AddProduct(const std::string& sku, model::Quantity stock = 0, model::Quantity threshold = 5, model::Money retail = 1000,
                            model::Money cost = 600) {
    core::ProductDraft draft;
    draft.sku                 = sku;
    draft.name                = "Product " + sku;
    draft.retail_price        = retail;
    draft.cost_price          = cost;
    draft.low_stock_threshold = threshold;
    auto product              = core::ProductStore(ctx).AddProduct(draft);
    if (stock != 0) {
      core::StockChange change;
      change.product_id = product.id;
      change.new_level  = stock;
      change.reason     = "Opening stock";
      core::StockLedger(ctx).AdjustStock(change);
    }
    return Product(product.id);
  }

  // One variant per (size, stock) pair, option name "Size".
  model::Product AddProductWithVariants(const std::string& sku, const std::vector<std::pair<std::string, model::Quantity>>& sizes) {
    core::ProductDraft draft;
    draft.sku          = sku;
    draft.name         = "Shirt " + sku;
    draft.retail_price = 2500;
    draft.cost_price   = 1200;
    for (const auto& [value, stock] : sizes) {
      model::Variant variant;
      variant.options      = {{"Size", value}};
      variant.sku          = sku + "-" + value;
      variant.stock        = stock;
      variant.retail_price = 2500;
      variant.cost_price   = 1200;
      draft.variants.push_back(variant);
    }
    return core::ProductStore(ctx).AddProduct(draft);
  }

  // Same repository seen by another tenant.
  core::CoreContext TenantContext(const std::string& tenant_id) {
    core::CoreContext other = ctx;
    other.identity          = std::make_shared<identity::StaticIdentity>(tenant_id, identity::Actor{"user-2", "Sam"});
    return other;
  }

  model::Product Product(const std::string& id) {
    return core::ProductStore(ctx).GetProduct(id);
  }

  bool Exists(const std::string& product_id) {
    auto tx = repository->Begin();
    return repository->GetProduct(*tx, identity->TenantId(), product_id).has_value();
  }

  std::vector<model::StockAdjustment> Ledger(const std::optional<std::string>& product_id = std::nullopt) {
    return core::StockLedger(ctx).ListAdjustments(product_id);
  }

  std::vector<model::Notification> Notifications() {
    auto tx = repository->Begin();
    return repository->ListNotifications(*tx, identity->TenantId());
  }

  std::vector<model::DeletionRecord> Tombstones() {
    auto tx = repository->Begin();
    return repository->ListDeletionRecords(*tx, identity->TenantId());
  }

  std::size_t TombstoneCount(std::string_view table) {
    std::size_t count = 0;
    for (const auto& record : Tombstones()) {
      if (record.table == table) ++count;
    }
    return count;
  }
};

} // namespace stockroom::testing
