#include <cassert>
#include <iostream>
#include <string>

#include "internal/core/stock_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using stockroom::core::StockChange;
using stockroom::core::StockLedger;
using stockroom::model::LedgerSource;
using stockroom::model::NotificationCategory;
using stockroom::testing::Fixture;
using stockroom::testing::Throws;

StockChange SetLevel(const std::string& product_id, stockroom::model::Quantity level, std::optional<std::string> variant_id = std::nullopt) {
  StockChange change;
  change.product_id = product_id;
  change.variant_id = std::move(variant_id);
  change.new_level  = level;
  change.reason     = "Count";
  return change;
}

void TestAdjustSequenceSumsNonZeroDeltas() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProduct("A-1");

  assert(ledger.AdjustStock(SetLevel(product.id, 5)).has_value());
  assert(!ledger.AdjustStock(SetLevel(product.id, 5)).has_value());
  assert(ledger.AdjustStock(SetLevel(product.id, 2)).has_value());
  assert(ledger.AdjustStock(SetLevel(product.id, 8)).has_value());

  assert(fx.Product(product.id).stock == 8);

  const auto rows = fx.Ledger(product.id);
  assert(rows.size() == 3);
  assert(rows[0].quantity == 5);
  assert(rows[1].quantity == -3);
  assert(rows[2].quantity == 6);
  for (const auto& row : rows) {
    assert(row.reason == "Count");
    assert(row.source == LedgerSource::kManual);
  }
}

void TestVariantAdjustKeepsProductTotal() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProductWithVariants("SH", {{"M", 3}, {"L", 4}});
  assert(product.stock == 7);

  const auto& medium = product.variants[0];
  const auto  row    = ledger.AdjustStock(SetLevel(product.id, 10, medium.id));
  assert(row && row->variant_id == medium.id && row->quantity == 7);

  const auto stored = fx.Product(product.id);
  assert(stored.variants[0].stock == 10);
  assert(stored.variants[1].stock == 4);
  assert(stored.stock == 14);
}

void TestProductWithVariantsNeedsVariantTarget() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProductWithVariants("SH", {{"M", 3}});

  assert(Throws<stockroom::util::ValidationError>([&] { ledger.AdjustStock(SetLevel(product.id, 1)); }));
  assert(fx.Product(product.id).stock == 3);
  assert(fx.Ledger(product.id).empty());
}

void TestMissingTargetIsNotFound() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProduct("A-1", 4);

  assert(Throws<stockroom::util::NotFound>([&] { ledger.AdjustStock(SetLevel("prod_missing", 1)); }));
  assert(Throws<stockroom::util::NotFound>([&] { ledger.AdjustStock(SetLevel(product.id, 1, std::string("var_missing"))); }));
  assert(fx.Product(product.id).stock == 4);
}

void TestForeignProductIsAccessDenied() {
  Fixture     fx;
  const auto  product = fx.AddProduct("A-1", 4);
  StockLedger foreign(fx.TenantContext("shop-2"));

  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.AdjustStock(SetLevel(product.id, 9)); }));
  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.ReceiveStock(product.id, std::nullopt, 3); }));
  assert(Throws<stockroom::util::NotFound>([&] { foreign.AdjustStock(SetLevel("prod_missing", 1)); }));

  assert(fx.Product(product.id).stock == 4);
  assert(fx.Ledger(product.id).size() == 1);
}

void TestReceiveStockAddsToCurrentLevel() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProduct("A-1", 4);

  const auto row = ledger.ReceiveStock(product.id, std::nullopt, 6);
  assert(row && row->quantity == 6 && row->reason == "Stock Received");
  assert(fx.Product(product.id).stock == 10);

  assert(Throws<stockroom::util::ValidationError>([&] { ledger.ReceiveStock(product.id, std::nullopt, -1); }));
  assert(!ledger.ReceiveStock(product.id, std::nullopt, 0).has_value());
}

void TestThresholdNotificationsFireOnCrossingOnly() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProduct("A-1", 10, /*threshold=*/5);
  fx.sink->delivered.clear();

  ledger.AdjustStock(SetLevel(product.id, 4)); // crosses threshold
  ledger.AdjustStock(SetLevel(product.id, 3)); // still below
  ledger.AdjustStock(SetLevel(product.id, 0)); // hits zero
  ledger.AdjustStock(SetLevel(product.id, 2)); // back up, below threshold
  ledger.AdjustStock(SetLevel(product.id, 9));
  ledger.AdjustStock(SetLevel(product.id, 5)); // crosses again

  const auto& delivered = fx.sink->delivered;
  assert(delivered.size() == 3);
  assert(delivered[0].message == "Low Stock Warning: Product A-1 (4 left)");
  assert(delivered[1].message == "Out of Stock: Product A-1");
  assert(delivered[2].message == "Low Stock Warning: Product A-1 (5 left)");
  for (const auto& notification : delivered) {
    assert(notification.category == NotificationCategory::kStock);
    assert(notification.related_id == product.id);
  }
  assert(fx.Notifications().size() == 3);
}

void TestVariantNotificationUsesVariantName() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProductWithVariants("SH", {{"XL", 2}});

  ledger.AdjustStock(SetLevel(product.id, 0, product.variants[0].id));

  assert(fx.sink->delivered.size() == 1);
  assert(fx.sink->delivered[0].message == "Out of Stock: Shirt SH (XL)");
  assert(fx.sink->delivered[0].related_id == product.variants[0].id);
}

void TestRolledBackChangeLeavesNoTrace() {
  Fixture     fx;
  StockLedger ledger(fx.ctx);
  const auto  product = fx.AddProduct("A-1", 1);
  fx.sink->delivered.clear();

  {
    auto tx = fx.repository->Begin();
    assert(ledger.Apply(*tx, fx.identity->TenantId(), SetLevel(product.id, 0)).has_value());
    // no commit
  }

  assert(fx.Product(product.id).stock == 1);
  assert(fx.Ledger(product.id).size() == 1);
  assert(fx.sink->delivered.empty());
  assert(fx.Notifications().empty());
}

} // namespace

int main() {
  TestAdjustSequenceSumsNonZeroDeltas();
  TestVariantAdjustKeepsProductTotal();
  TestProductWithVariantsNeedsVariantTarget();
  TestMissingTargetIsNotFound();
  TestForeignProductIsAccessDenied();
  TestReceiveStockAddsToCurrentLevel();
  TestThresholdNotificationsFireOnCrossingOnly();
  TestVariantNotificationUsesVariantName();
  TestRolledBackChangeLeavesNoTrace();

  std::cout << "stockroom_unit_stock_ledger: pass\n";
  return 0;
}
