#pragma once

#include <string>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/core/product_store.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/model/product.hpp"
#include "internal/model/sale.hpp"

namespace stockroom::db {
class Transaction;
}

namespace stockroom::core {

class DeletionPlan;

struct BulkDeleteResult {
  std::size_t deleted = 0;
  std::size_t skipped = 0; // still holding stock
};

struct RestoreResult {
  std::vector<std::string> restored_ids;
  std::vector<std::string> skipped_ids; // product already exists
};

/*
  Guarded deletes and restoration of products.

  Every delete runs as one DeletionPlan: the product (or variant), its
  ledger rows and its notifications disappear together and each removed
  row leaves a tombstone.

  Sales history is not consulted here; callers that must keep sold
  products check that themselves.
*/
class IntegrityGuard {
 public:
  explicit IntegrityGuard(CoreContext ctx);

  // Without force: PreconditionFailed when the product has variants or any
  // stock.
  void DeleteProduct(const std::string& product_id, bool force);

  // Without force: PreconditionFailed when the variant holds stock.
  model::Product DeleteVariant(const std::string& product_id, const std::string& variant_id, bool force);

  // Products at or below zero stock are deleted, the rest skipped. Unknown
  // ids are ignored.
  BulkDeleteResult BulkDeleteProducts(const std::vector<std::string>& product_ids);

  // Recreates deleted products from sale line snapshots, at stock 0 and
  // under the restored category.
  RestoreResult RestoreDeletedProducts(const std::vector<model::SaleLine>& lines);

  std::vector<model::DeletionRecord> ListDeletionRecords();

 private:
  void PlanProduct(db::Transaction& tx, const std::string& tenant_id, const model::Product& product, DeletionPlan& plan);

  CoreContext  ctx_;
  ProductStore products_;
};

} // namespace stockroom::core
