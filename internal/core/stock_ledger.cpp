#include "stock_ledger.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/model/names.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"
#include "ledger_reason.hpp"

namespace stockroom::core {

StockLedger::StockLedger(CoreContext ctx) : ctx_(std::move(ctx)) {
}

std::optional<model::Quantity> StockLedger::LevelOf(const model::Product& product, const std::optional<std::string>& variant_id) {
  if (!variant_id) {
    return product.stock;
  }
  const auto* variant = model::FindVariant(product, *variant_id);
  if (!variant) return std::nullopt;
  return variant->stock;
}

std::optional<model::StockAdjustment> StockLedger::AdjustStock(const StockChange& change) {
  auto tx      = ctx_.repository->Begin();
  auto applied = Apply(*tx, ctx_.identity->TenantId(), change);
  tx->Commit();
  return applied;
}

std::optional<model::StockAdjustment> StockLedger::ReceiveStock(const std::string& product_id, const std::optional<std::string>& variant_id,
                                                                model::Quantity quantity) {
  if (quantity < 0) {
    throw util::ValidationError("received quantity must be >= 0");
  }
  auto tx      = ctx_.repository->Begin();
  auto applied = Move(*tx, ctx_.identity->TenantId(), product_id, variant_id, quantity, std::string(kStockReceivedReason),
                       model::LedgerSource::kManual, {});
  tx->Commit();
  return applied;
}

std::vector<model::StockAdjustment> StockLedger::ListAdjustments(const std::optional<std::string>& product_id) {
  auto       tx     = ctx_.repository->Begin();
  const auto tenant = ctx_.identity->TenantId();
  if (product_id) {
    return ctx_.repository->ListAdjustmentsForProduct(*tx, tenant, *product_id);
  }
  return ctx_.repository->ListAdjustments(*tx, tenant);
}

std::optional<model::StockAdjustment> StockLedger::Move(db::Transaction& tx, const std::string& tenant_id, const std::string& product_id,
                                                         const std::optional<std::string>& variant_id, model::Quantity delta, std::string reason,
                                                         model::LedgerSource source, std::string source_id) {
  const auto product = LoadProduct(*ctx_.repository, tx, tenant_id, product_id);
  const auto current = LevelOf(product, variant_id);
  if (!current) {
    throw util::NotFound("variant not found: " + *variant_id);
  }

  StockChange change;
  change.product_id = product_id;
  change.variant_id = variant_id;
  change.new_level  = *current + delta;
  change.reason     = std::move(reason);
  change.source     = source;
  change.source_id  = std::move(source_id);
  return Apply(tx, tenant_id, change);
}

std::optional<model::StockAdjustment> StockLedger::Apply(db::Transaction& tx, const std::string& tenant_id, const StockChange& change) {
  auto product = LoadProduct(*ctx_.repository, tx, tenant_id, change.product_id);

  model::Variant* variant = nullptr;
  if (change.variant_id) {
    variant = model::FindVariant(product, *change.variant_id);
    if (!variant) {
      throw util::NotFound("variant not found: " + *change.variant_id);
    }
  } else if (!product.variants.empty()) {
    throw util::ValidationError("product " + product.id + " has variants; adjust a variant instead");
  }

  const model::Quantity old_level = variant ? variant->stock : product.stock;
  const model::Quantity delta     = change.new_level - old_level;
  if (delta == 0) {
    return std::nullopt;
  }

  if (variant) {
    variant->stock = change.new_level;
  } else {
    product.stock = change.new_level;
  }
  model::RecomputeStock(product);
  product.updated_at = util::Now();

  if (!product.variants.empty() && product.stock != model::VariantStockSum(product)) {
    throw util::InvariantViolation("product " + product.id + " stock diverged from its variants");
  }
  ThrowIfDbError(ctx_.repository->UpdateProduct(tx, product), "update product stock");

  model::StockAdjustment row;
  row.id         = util::PrefixedId("adj");
  row.tenant_id  = tenant_id;
  row.product_id = product.id;
  row.variant_id = change.variant_id;
  row.quantity   = delta;
  row.reason     = change.reason;
  row.source     = change.source;
  row.source_id  = change.source_id;
  row.created_at = product.updated_at;
  ThrowIfDbError(ctx_.repository->InsertAdjustment(tx, row), "insert stock adjustment");

  STOCKROOM_LOG_DEBUG("stock adjusted", {observability::StringField("product_id", product.id),
                                         observability::StringField("variant_id", change.variant_id.value_or("")),
                                         observability::IntField("delta", delta), observability::IntField("level", change.new_level),
                                         observability::StringField("reason", change.reason)});
  observability::Metrics::Instance().RecordStockMovement(model::ToString(change.source), delta);

  NotifyThresholdCrossing(tx, product, variant, old_level, change.new_level);
  return row;
}

void StockLedger::NotifyThresholdCrossing(db::Transaction& tx, const model::Product& product, const model::Variant* variant,
                                          model::Quantity old_level, model::Quantity new_level) {
  if (!ctx_.notifier) return;

  const auto  threshold  = product.low_stock_threshold;
  const auto  name       = model::DisplayName(product, variant);
  const auto& related_id = variant ? variant->id : product.id;

  if (old_level > 0 && new_level <= 0) {
    ctx_.notifier->Emit(tx, product.tenant_id, model::NotificationCategory::kStock, "Out of Stock: " + name, related_id);
  } else if (old_level > threshold && new_level <= threshold && new_level > 0) {
    ctx_.notifier->Emit(tx, product.tenant_id, model::NotificationCategory::kStock,
                        "Low Stock Warning: " + name + " (" + std::to_string(new_level) + " left)", related_id);
  }
}

} // namespace stockroom::core
