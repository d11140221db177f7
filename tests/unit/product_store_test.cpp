#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/core/product_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using stockroom::core::CategoryUpdateMode;
using stockroom::core::ProductDraft;
using stockroom::core::ProductStore;
using stockroom::model::PriceType;
using stockroom::testing::Fixture;
using stockroom::testing::Throws;

ProductDraft Draft(const std::string& sku) {
  ProductDraft draft;
  draft.sku          = sku;
  draft.name         = "Mug " + sku;
  draft.retail_price = 1200;
  draft.cost_price   = 500;
  return draft;
}

void TestAddProductAppliesDefaults() {
  Fixture fx;
  fx.ctx.settings.default_low_stock_threshold = 7;
  ProductStore store(fx.ctx);

  const auto product = store.AddProduct(Draft("MUG-1"));
  assert(product.id.rfind("prod_", 0) == 0);
  assert(product.tenant_id == "shop-1");
  assert(product.stock == 0);
  assert(product.low_stock_threshold == 7);
  assert(product.price_history.empty());

  auto explicit_zero                = Draft("MUG-2");
  explicit_zero.low_stock_threshold = 0;
  assert(store.AddProduct(explicit_zero).low_stock_threshold == 0);
}

void TestAddProductRejectsBadDrafts() {
  Fixture      fx;
  ProductStore store(fx.ctx);
  store.AddProduct(Draft("MUG-1"));

  assert(Throws<stockroom::util::ValidationError>([&] { store.AddProduct(Draft("MUG-1")); }));
  assert(Throws<stockroom::util::ValidationError>([&] { store.AddProduct(Draft("")); }));

  auto negative         = Draft("MUG-2");
  negative.retail_price = -1;
  assert(Throws<stockroom::util::ValidationError>([&] { store.AddProduct(negative); }));

  auto foreign      = Draft("MUG-3");
  foreign.tenant_id = "shop-2";
  assert(Throws<stockroom::util::AccessDenied>([&] { store.AddProduct(foreign); }));

  assert(store.ListProducts().size() == 1);
}

void TestUpdateAppendsPriceHistory() {
  Fixture      fx;
  ProductStore store(fx.ctx);
  auto         product = fx.AddProductWithVariants("TEE", {{"S", 2}, {"M", 3}});

  product.retail_price             = 2900;
  product.variants[0].cost_price   = 1300;
  product.variants[1].retail_price = 2500; // unchanged
  auto updated                     = store.UpdateProduct(product);

  assert(updated.price_history.size() == 1);
  assert(updated.price_history[0].price_type == PriceType::kRetail);
  assert(updated.price_history[0].old_value == 2500);
  assert(updated.price_history[0].new_value == 2900);
  assert(updated.price_history[0].actor_name == "Alex");
  assert(updated.variants[0].price_history.size() == 1);
  assert(updated.variants[0].price_history[0].price_type == PriceType::kCost);
  assert(updated.variants[1].price_history.empty());

  updated.retail_price = 3100;
  const auto again     = store.UpdateProduct(updated);
  assert(again.price_history.size() == 2);
  assert(again.price_history[0].new_value == 2900);
  assert(again.price_history[1].old_value == 2900);
  assert(again.price_history[1].new_value == 3100);
}

void TestUpdateDoesNotTouchStock() {
  Fixture      fx;
  ProductStore store(fx.ctx);
  auto         plain   = fx.AddProduct("MUG-1", 4);
  auto         shirt   = fx.AddProductWithVariants("TEE", {{"S", 2}});

  plain.stock = 99;
  assert(store.UpdateProduct(plain).stock == 4);

  shirt.variants[0].stock = 50;
  stockroom::model::Variant large;
  large.options = {{"Size", "L"}};
  large.stock   = 10;
  shirt.variants.push_back(large);

  const auto updated = store.UpdateProduct(shirt);
  assert(updated.variants.size() == 2);
  assert(updated.variants[0].stock == 2);
  assert(updated.variants[1].stock == 0);
  assert(!updated.variants[1].id.empty());
  assert(updated.stock == 2);
  assert(fx.Ledger().size() == 1); // only the opening stock of MUG-1
}

void TestUpdateGuards() {
  Fixture      fx;
  ProductStore store(fx.ctx);
  auto         shirt = fx.AddProductWithVariants("TEE", {{"S", 2}, {"M", 0}});
  auto         plain = fx.AddProduct("MUG-1", 3);
  fx.AddProduct("MUG-2");

  auto dropped = shirt;
  dropped.variants.pop_back();
  assert(Throws<stockroom::util::ValidationError>([&] { store.UpdateProduct(dropped); }));

  auto with_variant = plain;
  with_variant.variants.push_back(stockroom::model::Variant{});
  assert(Throws<stockroom::util::PreconditionFailed>([&] { store.UpdateProduct(with_variant); }));

  auto clash = plain;
  clash.sku  = "MUG-2";
  assert(Throws<stockroom::util::ValidationError>([&] { store.UpdateProduct(clash); }));

  auto foreign      = plain;
  foreign.tenant_id = "shop-2";
  assert(Throws<stockroom::util::AccessDenied>([&] { store.UpdateProduct(foreign); }));

  auto missing = plain;
  missing.id   = "prod_missing";
  assert(Throws<stockroom::util::NotFound>([&] { store.UpdateProduct(missing); }));
}

void TestImportSkipsKnownSkus() {
  Fixture      fx;
  ProductStore store(fx.ctx);
  store.AddProduct(Draft("MUG-1"));

  const auto result = store.ImportProducts({Draft("MUG-1"), Draft("MUG-2"), Draft("MUG-2"), Draft("MUG-3")});
  assert(result.imported_ids.size() == 2);
  assert((result.skipped_skus == std::vector<std::string>{"MUG-1", "MUG-2"}));
  assert(store.ListProducts().size() == 3);

  assert(Throws<stockroom::util::ValidationError>([&] { store.ImportProducts({Draft("MUG-1"), Draft("MUG-3")}); }));
  assert(store.ListProducts().size() == 3);
}

void TestImportBooksOpeningStock() {
  Fixture      fx;
  ProductStore store(fx.ctx);

  auto stocked          = Draft("MUG-1");
  stocked.opening_stock = 12;
  const auto result     = store.ImportProducts({stocked, Draft("MUG-2")});
  assert(result.imported_ids.size() == 2);

  const auto mug = fx.Product(result.imported_ids[0]);
  assert(mug.stock == 12);
  const auto rows = fx.Ledger(mug.id);
  assert(rows.size() == 1);
  assert(rows[0].quantity == 12 && rows[0].reason == "Imported");
  assert(rows[0].source == stockroom::model::LedgerSource::kManual);

  assert(fx.Product(result.imported_ids[1]).stock == 0);
  assert(fx.Ledger(result.imported_ids[1]).empty());
  assert(fx.Notifications().empty());

  auto negative          = Draft("MUG-3");
  negative.opening_stock = -1;
  assert(Throws<stockroom::util::ValidationError>([&] { store.ImportProducts({negative}); }));

  auto added          = Draft("MUG-4");
  added.opening_stock = 3;
  assert(Throws<stockroom::util::ValidationError>([&] { store.AddProduct(added); }));
  assert(store.ListProducts().size() == 2);
}

void TestBulkCategoryModes() {
  Fixture      fx;
  ProductStore store(fx.ctx);
  const auto   a = store.AddProduct(Draft("A"));
  const auto   b = store.AddProduct(Draft("B"));

  assert(store.BulkUpdateCategories({a.id, b.id, "prod_missing"}, {"cat_1", "cat_2"}, CategoryUpdateMode::kAdd) == 2);
  assert(store.BulkUpdateCategories({a.id}, {"cat_2"}, CategoryUpdateMode::kAdd) == 0);
  assert(store.BulkUpdateCategories({a.id}, {"cat_1"}, CategoryUpdateMode::kRemove) == 1);
  assert((store.GetProduct(a.id).category_ids == std::vector<std::string>{"cat_2"}));

  assert(store.BulkUpdateCategories({b.id}, {"cat_9"}, CategoryUpdateMode::kReplace) == 1);
  assert((store.GetProduct(b.id).category_ids == std::vector<std::string>{"cat_9"}));
}

void TestEnsureCategoryIsIdempotent() {
  Fixture      fx;
  ProductStore store(fx.ctx);

  auto       tx     = fx.repository->Begin();
  const auto first  = store.EnsureCategory(*tx, "shop-1", "Restored");
  const auto second = store.EnsureCategory(*tx, "shop-1", "Restored");
  tx->Commit();

  assert(first == second);
  assert(store.ListCategories().size() == 1);
}

} // namespace

int main() {
  TestAddProductAppliesDefaults();
  TestAddProductRejectsBadDrafts();
  TestUpdateAppendsPriceHistory();
  TestUpdateDoesNotTouchStock();
  TestUpdateGuards();
  TestImportSkipsKnownSkus();
  TestImportBooksOpeningStock();
  TestBulkCategoryModes();
  TestEnsureCategoryIsIdempotent();

  std::cout << "stockroom_unit_product_store: pass\n";
  return 0;
}
