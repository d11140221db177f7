#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/core/integrity_guard.hpp"
#include "internal/core/sale_processor.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using stockroom::core::IntegrityGuard;
using stockroom::core::CartLine;
using stockroom::core::ProductStore;
using stockroom::core::SaleProcessor;
using stockroom::core::StockChange;
using stockroom::core::StockLedger;
using stockroom::testing::Fixture;
using stockroom::testing::Throws;
namespace tables = stockroom::model::tables;

void SetLevel(Fixture& fx, const std::string& product_id, stockroom::model::Quantity level, std::optional<std::string> variant_id = std::nullopt) {
  StockChange change;
  change.product_id = product_id;
  change.variant_id = std::move(variant_id);
  change.new_level  = level;
  change.reason     = "Count";
  StockLedger(fx.ctx).AdjustStock(change);
}

void TestDeleteWithStockNeedsForce() {
  Fixture        fx;
  IntegrityGuard guard(fx.ctx);
  const auto     product = fx.AddProduct("A", 10, /*threshold=*/5);
  SetLevel(fx, product.id, 3); // low stock notification
  const auto other = fx.AddProduct("B", 4);

  bool threw = false;
  try {
    guard.DeleteProduct(product.id, /*force=*/false);
  } catch (const stockroom::util::PreconditionFailed&) {
    threw = true;
  }
  assert(threw);
  assert(fx.Exists(product.id));
  assert(fx.Tombstones().empty());

  guard.DeleteProduct(product.id, /*force=*/true);
  assert(!fx.Exists(product.id));
  assert(fx.Ledger(product.id).empty());

  const auto notifications = fx.Notifications();
  assert(std::none_of(notifications.begin(), notifications.end(), [&](const auto& n) { return n.related_id == product.id; }));

  assert(fx.TombstoneCount(tables::kProducts) == 1);
  assert(fx.TombstoneCount(tables::kStockAdjustments) == 2);
  assert(fx.TombstoneCount(tables::kNotifications) == 1);

  assert(fx.Exists(other.id));
  assert(fx.Ledger(other.id).size() == 1);
}

void TestDeleteProductWithVariants() {
  Fixture        fx;
  IntegrityGuard guard(fx.ctx);
  const auto     shirt = fx.AddProductWithVariants("TEE", {{"S", 0}, {"M", 0}});

  assert(Throws<stockroom::util::PreconditionFailed>([&] { guard.DeleteProduct(shirt.id, false); }));

  guard.DeleteProduct(shirt.id, true);
  assert(!fx.Exists(shirt.id));
  assert(fx.TombstoneCount(tables::kProducts) == 1);
  assert(fx.TombstoneCount(tables::kProductVariants) == 2);

  assert(Throws<stockroom::util::NotFound>([&] { guard.DeleteProduct(shirt.id, true); }));
}

void TestDeleteVariantRecomputesParent() {
  Fixture        fx;
  IntegrityGuard guard(fx.ctx);
  const auto     shirt = fx.AddProductWithVariants("TEE", {{"S", 3}, {"M", 4}});
  const auto     small = shirt.variants[0].id;
  const auto     large = shirt.variants[1].id;
  SetLevel(fx, shirt.id, 0, small); // out of stock notification for S
  SetLevel(fx, shirt.id, 6, large);

  assert(Throws<stockroom::util::PreconditionFailed>([&] { guard.DeleteVariant(shirt.id, large, false); }));

  const auto parent = guard.DeleteVariant(shirt.id, small, false);
  assert(parent.variants.size() == 1);
  assert(parent.stock == 6);

  const auto stored = fx.Product(shirt.id);
  assert(stored.variants.size() == 1 && stored.variants[0].id == large);
  assert(stored.stock == 6);

  const auto rows = fx.Ledger(shirt.id);
  assert(rows.size() == 1 && rows[0].variant_id == large);
  assert(fx.Notifications().empty());

  assert(fx.TombstoneCount(tables::kProductVariants) == 1);
  assert(fx.TombstoneCount(tables::kStockAdjustments) == 1);
  assert(fx.TombstoneCount(tables::kNotifications) == 1);

  assert(Throws<stockroom::util::NotFound>([&] { guard.DeleteVariant(shirt.id, small, true); }));
}

void TestForeignDeletesAreAccessDenied() {
  Fixture        fx;
  const auto     plain = fx.AddProduct("A");
  const auto     shirt = fx.AddProductWithVariants("TEE", {{"S", 0}});
  IntegrityGuard foreign(fx.TenantContext("shop-2"));

  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.DeleteProduct(plain.id, true); }));
  assert(Throws<stockroom::util::AccessDenied>([&] { foreign.DeleteVariant(shirt.id, shirt.variants[0].id, true); }));
  assert(Throws<stockroom::util::NotFound>([&] { foreign.DeleteProduct("prod_missing", true); }));

  assert(fx.Exists(plain.id));
  assert(fx.Product(shirt.id).variants.size() == 1);
  assert(fx.Tombstones().empty());
}

void TestBulkDeletePartitionsByStock() {
  Fixture        fx;
  IntegrityGuard guard(fx.ctx);
  const auto     empty    = fx.AddProduct("EMPTY");
  const auto     negative = fx.AddProduct("NEG", -2);
  const auto     stocked  = fx.AddProduct("FULL", 5);

  const auto result = guard.BulkDeleteProducts({empty.id, negative.id, stocked.id, "prod_missing"});
  assert(result.deleted == 2);
  assert(result.skipped == 1);

  assert(!fx.Exists(empty.id));
  assert(!fx.Exists(negative.id));
  assert(fx.Exists(stocked.id));
  assert(fx.Ledger(negative.id).empty());
  assert(fx.Ledger(stocked.id).size() == 1);
}

void TestRestoreFromSaleLines() {
  Fixture        fx;
  IntegrityGuard guard(fx.ctx);
  SaleProcessor  sales(fx.ctx);
  const auto     mug = fx.AddProduct("MUG", 5);

  CartLine line;
  line.product_id   = mug.id;
  line.quantity     = 2;
  line.retail_price = mug.retail_price;
  const auto sale   = sales.ProcessSale({{line}, {}});

  guard.DeleteProduct(mug.id, true);
  assert(fx.TombstoneCount(tables::kProducts) == 1);

  // Another product took the SKU in the meantime.
  const auto squatter = fx.AddProduct("MUG");

  const auto result = guard.RestoreDeletedProducts(sale.items);
  assert(result.restored_ids.size() == 1 && result.restored_ids[0] == mug.id);

  const auto restored = fx.Product(mug.id);
  assert(restored.sku == "MUG-RESTORED");
  assert(restored.name == "Product MUG");
  assert(restored.stock == 0);
  assert(fx.Ledger(mug.id).empty());
  assert(fx.TombstoneCount(tables::kProducts) == 0);

  const auto categories = ProductStore(fx.ctx).ListCategories();
  assert(categories.size() == 1 && categories[0].name == "Restored");
  assert((restored.category_ids == std::vector<std::string>{categories[0].id}));

  // Existing products are left alone.
  const auto again = guard.RestoreDeletedProducts(sale.items);
  assert(again.restored_ids.empty());
  assert((again.skipped_ids == std::vector<std::string>{mug.id}));
  assert(fx.Exists(squatter.id));
}

void TestRestoreRecreatesVariantsAndSuffixesRepeatedly() {
  Fixture        fx;
  IntegrityGuard guard(fx.ctx);
  fx.AddProduct("TEE");
  fx.AddProduct("TEE-RESTORED");

  stockroom::model::SaleLine small;
  small.product_id      = "prod_old";
  small.variant_id      = "var_small";
  small.variant_options = {{"Size", "S"}};
  small.name            = "Tee";
  small.sku             = "TEE";
  small.quantity        = 1;
  small.retail_price    = 2000;
  auto large            = small;
  large.variant_id      = "var_large";
  large.variant_options = {{"Size", "L"}};

  const auto result = guard.RestoreDeletedProducts({small, large, small});
  assert(result.restored_ids.size() == 1);

  const auto restored = fx.Product("prod_old");
  assert(restored.sku == "TEE-RESTORED-2");
  assert(restored.variants.size() == 2);
  assert(restored.variants[1].options[0].value == "L");
  assert(restored.stock == 0);
}

} // namespace

int main() {
  TestDeleteWithStockNeedsForce();
  TestDeleteProductWithVariants();
  TestDeleteVariantRecomputesParent();
  TestForeignDeletesAreAccessDenied();
  TestBulkDeletePartitionsByStock();
  TestRestoreFromSaleLines();
  TestRestoreRecreatesVariantsAndSuffixesRepeatedly();

  std::cout << "stockroom_unit_integrity_guard: pass\n";
  return 0;
}
