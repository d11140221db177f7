#include "integrity_guard.hpp"

#include <algorithm>
#include <map>

#include "internal/core/db_errors.hpp"
#include "internal/core/deletion_plan.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stockroom::core {

namespace {

constexpr std::string_view kRestoredSuffix = "-RESTORED";

bool RelatesTo(const model::Notification& notification, const model::Product& product) {
  if (notification.related_id == product.id) return true;
  return std::any_of(product.variants.begin(), product.variants.end(),
                     [&](const model::Variant& variant) { return notification.related_id == variant.id; });
}

} // namespace

IntegrityGuard::IntegrityGuard(CoreContext ctx) : ctx_(ctx), products_(ctx) {
}

void IntegrityGuard::PlanProduct(db::Transaction& tx, const std::string& tenant_id, const model::Product& product, DeletionPlan& plan) {
  for (const auto& row : ctx_.repository->ListAdjustmentsForProduct(tx, tenant_id, product.id)) {
    plan.RemoveAdjustment(row.id);
  }
  for (const auto& notification : ctx_.repository->ListNotifications(tx, tenant_id)) {
    if (RelatesTo(notification, product)) plan.RemoveNotification(notification.id);
  }
  plan.RemoveProduct(product);
}

void IntegrityGuard::DeleteProduct(const std::string& product_id, bool force) {
  const auto tenant = ctx_.identity->TenantId();

  auto tx      = ctx_.repository->Begin();
  const auto product = LoadProduct(*ctx_.repository, *tx, tenant, product_id);
  if (!force) {
    if (!product.variants.empty()) {
      throw util::PreconditionFailed("Product " + product_id + " has variants. Delete the variants first.");
    }
    if (model::TotalStock(product) > 0) {
      throw util::PreconditionFailed("Product " + product_id + " still has stock.");
    }
  }

  DeletionPlan plan(ctx_.repository, tenant);
  PlanProduct(*tx, tenant, product, plan);
  plan.Execute(*tx);
  tx->Commit();

  STOCKROOM_LOG_INFO("product deleted", {observability::StringField("product_id", product_id), observability::BoolField("force", force),
                                         observability::IntField("ledger_rows", static_cast<std::int64_t>(plan.Count(model::tables::kStockAdjustments))),
                                         observability::IntField("notifications", static_cast<std::int64_t>(plan.Count(model::tables::kNotifications)))});
}

model::Product IntegrityGuard::DeleteVariant(const std::string& product_id, const std::string& variant_id, bool force) {
  const auto tenant = ctx_.identity->TenantId();

  auto tx      = ctx_.repository->Begin();
  const auto  product = LoadProduct(*ctx_.repository, *tx, tenant, product_id);
  const auto* variant = model::FindVariant(product, variant_id);
  if (!variant) {
    throw util::NotFound("variant not found: " + variant_id);
  }
  if (!force && variant->stock > 0) {
    throw util::PreconditionFailed("Variant " + variant_id + " still has stock.");
  }

  DeletionPlan plan(ctx_.repository, tenant);
  for (const auto& row : ctx_.repository->ListAdjustmentsForProduct(*tx, tenant, product_id)) {
    if (row.variant_id == variant_id) plan.RemoveAdjustment(row.id);
  }
  for (const auto& notification : ctx_.repository->ListNotifications(*tx, tenant)) {
    if (notification.related_id == variant_id) plan.RemoveNotification(notification.id);
  }

  model::Product parent = product;
  parent.variants.erase(std::remove_if(parent.variants.begin(), parent.variants.end(), [&](const model::Variant& v) { return v.id == variant_id; }),
                        parent.variants.end());
  parent.stock      = model::VariantStockSum(parent);
  parent.updated_at = util::Now();
  plan.RemoveVariant(parent, variant_id);

  plan.Execute(*tx);
  tx->Commit();

  STOCKROOM_LOG_INFO("variant deleted", {observability::StringField("product_id", product_id), observability::StringField("variant_id", variant_id),
                                         observability::IntField("stock", parent.stock)});
  return parent;
}

BulkDeleteResult IntegrityGuard::BulkDeleteProducts(const std::vector<std::string>& product_ids) {
  const auto tenant = ctx_.identity->TenantId();

  BulkDeleteResult result;
  auto             tx = ctx_.repository->Begin();
  DeletionPlan     plan(ctx_.repository, tenant);
  for (const auto& id : product_ids) {
    auto product = ctx_.repository->GetProduct(*tx, tenant, id);
    if (!product) continue;
    if (model::TotalStock(*product) > 0) {
      ++result.skipped;
      continue;
    }
    PlanProduct(*tx, tenant, *product, plan);
  }
  result.deleted = plan.Count(model::tables::kProducts);

  if (!plan.Empty()) {
    plan.Execute(*tx);
    tx->Commit();
  }

  STOCKROOM_LOG_INFO("bulk product delete", {observability::IntField("deleted", static_cast<std::int64_t>(result.deleted)),
                                             observability::IntField("skipped", static_cast<std::int64_t>(result.skipped))});
  return result;
}

RestoreResult IntegrityGuard::RestoreDeletedProducts(const std::vector<model::SaleLine>& lines) {
  const auto tenant = ctx_.identity->TenantId();

  // Group by product, keeping first-seen order.
  std::vector<std::string>                                   order;
  std::map<std::string, std::vector<const model::SaleLine*>> groups;
  for (const auto& line : lines) {
    if (line.product_id.empty()) continue;
    auto& group = groups[line.product_id];
    if (group.empty()) order.push_back(line.product_id);
    group.push_back(&line);
  }

  RestoreResult result;
  auto          tx = ctx_.repository->Begin();
  std::string   category_id;

  for (const auto& product_id : order) {
    if (ctx_.repository->GetProduct(*tx, tenant, product_id)) {
      result.skipped_ids.push_back(product_id);
      continue;
    }
    const auto& group = groups[product_id];
    const auto* first = group.front();

    model::Product product;
    product.id                  = product_id;
    product.tenant_id           = tenant;
    product.name                = first->name;
    product.retail_price        = first->retail_price;
    product.cost_price          = first->cost_price;
    product.low_stock_threshold = ctx_.settings.default_low_stock_threshold;
    product.created_at          = util::Now();
    product.updated_at          = product.created_at;

    for (const auto* line : group) {
      if (!line->variant_id || model::FindVariant(product, *line->variant_id)) continue;
      model::Variant variant;
      variant.id           = *line->variant_id;
      variant.options      = line->variant_options;
      variant.sku          = line->sku;
      variant.cost_price   = line->cost_price;
      variant.retail_price = line->retail_price;
      product.variants.push_back(std::move(variant));
    }
    product.stock = 0;

    const std::string base_sku = first->sku.empty() ? product_id : first->sku;
    product.sku                = base_sku;
    for (int attempt = 1; ctx_.repository->FindProductBySku(*tx, tenant, product.sku); ++attempt) {
      product.sku = base_sku + std::string(kRestoredSuffix) + (attempt > 1 ? "-" + std::to_string(attempt) : "");
    }

    // Leftovers from the product's previous life.
    std::vector<std::string> stale_rows;
    for (const auto& row : ctx_.repository->ListAdjustmentsForProduct(*tx, tenant, product_id)) {
      stale_rows.push_back(row.id);
    }
    ThrowIfDbError(ctx_.repository->DeleteAdjustments(*tx, tenant, stale_rows), "purge stale ledger rows");

    std::vector<std::string> stale_notifications;
    for (const auto& notification : ctx_.repository->ListNotifications(*tx, tenant)) {
      if (RelatesTo(notification, product)) stale_notifications.push_back(notification.id);
    }
    ThrowIfDbError(ctx_.repository->DeleteNotifications(*tx, tenant, stale_notifications), "purge stale notifications");

    ThrowIfDbError(ctx_.repository->DeleteDeletionRecord(*tx, tenant, product.id, std::string(model::tables::kProducts)), "drop product tombstone");
    for (const auto& variant : product.variants) {
      ThrowIfDbError(ctx_.repository->DeleteDeletionRecord(*tx, tenant, variant.id, std::string(model::tables::kProductVariants)),
                     "drop variant tombstone");
    }

    if (category_id.empty()) {
      category_id = products_.EnsureCategory(*tx, tenant, ctx_.settings.restored_category_name);
    }
    product.category_ids.push_back(category_id);

    ThrowIfDbError(ctx_.repository->InsertProduct(*tx, product), "restore product");
    result.restored_ids.push_back(product.id);

    STOCKROOM_LOG_INFO("product restored", {observability::StringField("product_id", product.id), observability::StringField("sku", product.sku),
                                            observability::IntField("purged_ledger_rows", static_cast<std::int64_t>(stale_rows.size()))});
  }
  tx->Commit();
  return result;
}

std::vector<model::DeletionRecord> IntegrityGuard::ListDeletionRecords() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->ListDeletionRecords(*tx, ctx_.identity->TenantId());
}

} // namespace stockroom::core
