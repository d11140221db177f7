#include "deletion_plan.hpp"

#include <algorithm>

#include "internal/core/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/deletion_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace stockroom::core {

DeletionPlan::DeletionPlan(std::shared_ptr<db::Repository> repository, std::string tenant_id)
    : repository_(std::move(repository)), tenant_id_(std::move(tenant_id)) {
}

bool DeletionPlan::Plan(std::string_view table, const std::string& id) {
  auto key = std::make_pair(std::string(table), id);
  if (!seen_.insert(key).second) return false;
  planned_.push_back(std::move(key));
  return true;
}

void DeletionPlan::RemoveProduct(const model::Product& product) {
  Plan(model::tables::kProducts, product.id);
  for (const auto& variant : product.variants) {
    Plan(model::tables::kProductVariants, variant.id);
  }
  rewrites_.erase(std::remove_if(rewrites_.begin(), rewrites_.end(), [&](const model::Product& p) { return p.id == product.id; }), rewrites_.end());
}

void DeletionPlan::RemoveVariant(model::Product parent_after_removal, const std::string& variant_id) {
  if (!Plan(model::tables::kProductVariants, variant_id)) return;

  // Later rewrites of the same parent replace earlier ones.
  auto it = std::find_if(rewrites_.begin(), rewrites_.end(), [&](const model::Product& p) { return p.id == parent_after_removal.id; });
  if (it != rewrites_.end()) {
    *it = std::move(parent_after_removal);
  } else {
    rewrites_.push_back(std::move(parent_after_removal));
  }
}

void DeletionPlan::RemoveAdjustment(const std::string& id) {
  Plan(model::tables::kStockAdjustments, id);
}

void DeletionPlan::RemoveNotification(const std::string& id) {
  Plan(model::tables::kNotifications, id);
}

void DeletionPlan::RemoveSale(const std::string& id) {
  Plan(model::tables::kSales, id);
}

void DeletionPlan::RemovePurchaseOrder(const std::string& id) {
  Plan(model::tables::kPurchaseOrders, id);
}

bool DeletionPlan::Empty() const {
  return planned_.empty();
}

std::size_t DeletionPlan::Count(std::string_view table) const {
  return static_cast<std::size_t>(std::count_if(planned_.begin(), planned_.end(), [&](const auto& entry) { return entry.first == table; }));
}

std::vector<std::string> DeletionPlan::IdsFor(std::string_view table) const {
  std::vector<std::string> ids;
  for (const auto& [t, id] : planned_) {
    if (t == table) ids.push_back(id);
  }
  return ids;
}

void DeletionPlan::Execute(db::Transaction& tx) {
  for (const auto& product : rewrites_) {
    ThrowIfDbError(repository_->UpdateProduct(tx, product), "rewrite product " + product.id);
  }

  ThrowIfDbError(repository_->DeleteAdjustments(tx, tenant_id_, IdsFor(model::tables::kStockAdjustments)), "delete stock adjustments");
  ThrowIfDbError(repository_->DeleteNotifications(tx, tenant_id_, IdsFor(model::tables::kNotifications)), "delete notifications");
  ThrowIfDbError(repository_->DeleteSales(tx, tenant_id_, IdsFor(model::tables::kSales)), "delete sales");

  for (const auto& id : IdsFor(model::tables::kPurchaseOrders)) {
    ThrowIfDbError(repository_->DeletePurchaseOrder(tx, tenant_id_, id), "delete purchase order " + id);
  }
  for (const auto& id : IdsFor(model::tables::kProducts)) {
    ThrowIfDbError(repository_->DeleteProduct(tx, tenant_id_, id), "delete product " + id);
  }

  const auto now = util::Now();
  for (const auto& [table, id] : planned_) {
    model::DeletionRecord record;
    record.id         = id;
    record.tenant_id  = tenant_id_;
    record.table      = table;
    record.deleted_at = now;
    ThrowIfDbError(repository_->InsertDeletionRecord(tx, record), "record deletion of " + id);
  }

  STOCKROOM_LOG_INFO("deletion plan executed", {observability::IntField("tombstones", static_cast<std::int64_t>(planned_.size())),
                                                observability::IntField("products", static_cast<std::int64_t>(Count(model::tables::kProducts))),
                                                observability::IntField("sales", static_cast<std::int64_t>(Count(model::tables::kSales)))});
}

} // namespace stockroom::core
