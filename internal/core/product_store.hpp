#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/model/product.hpp"

namespace stockroom::db {
class Transaction;
}

namespace stockroom::core {

struct ProductDraft {
  std::string id; // generated when empty
  std::string tenant_id;

  std::string                    sku;
  std::string                    name;
  model::Money                   retail_price = 0;
  model::Money                   cost_price   = 0;
  std::optional<model::Quantity> low_stock_threshold; // configured default when unset
  std::vector<model::Variant>    variants;
  std::vector<std::string>       category_ids;

  // Import only. Written through the ledger for products without variants.
  model::Quantity opening_stock = 0;
};

struct ImportResult {
  std::vector<std::string> imported_ids;
  std::vector<std::string> skipped_skus;
};

enum class CategoryUpdateMode {
  kAdd,
  kReplace,
  kRemove,
};

/*
  Product catalogue: creation, edits with price history, categories.

  Stock is never written here except for the initial variant levels of a
  new product; every later change goes through StockLedger.
*/
class ProductStore {
 public:
  explicit ProductStore(CoreContext ctx);

  model::Product AddProduct(const ProductDraft& draft);

  // Price changes are appended to the product and variant histories.
  // Stock fields of `product` are ignored.
  model::Product UpdateProduct(const model::Product& product);

  // Adds every draft with an unseen SKU, then books its opening stock as
  // an "Imported" ledger row. ValidationError when none was new.
  ImportResult ImportProducts(const std::vector<ProductDraft>& drafts);

  // Returns the number of products whose category list changed.
  std::size_t BulkUpdateCategories(const std::vector<std::string>& product_ids, const std::vector<std::string>& category_ids,
                                   CategoryUpdateMode mode);

  std::vector<model::Product>  ListProducts();
  model::Product               GetProduct(const std::string& id);
  std::vector<model::Category> ListCategories();

  // Returns the id of the category with `name`, creating it if needed.
  std::string EnsureCategory(db::Transaction& tx, const std::string& tenant_id, const std::string& name);

 private:
  model::Product Insert(db::Transaction& tx, const std::string& tenant_id, const ProductDraft& draft);

  CoreContext ctx_;
};

} // namespace stockroom::core
