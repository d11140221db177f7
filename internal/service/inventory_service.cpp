#include "inventory_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/notify/notifier.hpp"
#include "observe.hpp"

namespace stockroom::service {

InventoryService::InventoryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

util::OutcomeOf<model::Product> InventoryService::AddProduct(const core::ProductDraft& draft) {
  return Observe(ctx_, "InventoryService.AddProduct", [&] { return ctx_.products->AddProduct(draft); });
}

util::OutcomeOf<model::Product> InventoryService::UpdateProduct(const model::Product& product) {
  return Observe(ctx_, "InventoryService.UpdateProduct", [&] { return ctx_.products->UpdateProduct(product); });
}

util::OutcomeOf<core::ImportResult> InventoryService::ImportProducts(const std::vector<core::ProductDraft>& drafts) {
  return Observe(ctx_, "InventoryService.ImportProducts", [&] { return ctx_.products->ImportProducts(drafts); });
}

util::OutcomeOf<std::size_t> InventoryService::BulkUpdateCategories(const std::vector<std::string>& product_ids,
                                                                    const std::vector<std::string>& category_ids, core::CategoryUpdateMode mode) {
  return Observe(ctx_, "InventoryService.BulkUpdateCategories", [&] { return ctx_.products->BulkUpdateCategories(product_ids, category_ids, mode); });
}

util::OutcomeOf<std::vector<model::Product>> InventoryService::ListProducts() {
  return Observe(ctx_, "InventoryService.ListProducts", [&] { return ctx_.products->ListProducts(); });
}

util::OutcomeOf<model::Product> InventoryService::GetProduct(const std::string& product_id) {
  return Observe(ctx_, "InventoryService.GetProduct", [&] { return ctx_.products->GetProduct(product_id); });
}

util::OutcomeOf<std::vector<model::Category>> InventoryService::ListCategories() {
  return Observe(ctx_, "InventoryService.ListCategories", [&] { return ctx_.products->ListCategories(); });
}

// ------------------------------------------------------------------
// Stock
// ------------------------------------------------------------------

util::Outcome InventoryService::AdjustStock(const std::string& product_id, const std::optional<std::string>& variant_id, model::Quantity new_level,
                                            const std::string& reason) {
  return Observe(ctx_, "InventoryService.AdjustStock", [&] {
    core::StockChange change;
    change.product_id = product_id;
    change.variant_id = variant_id;
    change.new_level  = new_level;
    change.reason     = reason;
    ctx_.ledger->AdjustStock(change);
  });
}

util::Outcome InventoryService::ReceiveStock(const std::string& product_id, const std::optional<std::string>& variant_id, model::Quantity quantity) {
  return Observe(ctx_, "InventoryService.ReceiveStock", [&] { ctx_.ledger->ReceiveStock(product_id, variant_id, quantity); });
}

util::OutcomeOf<std::vector<model::StockAdjustment>> InventoryService::ListAdjustments(const std::optional<std::string>& product_id) {
  return Observe(ctx_, "InventoryService.ListAdjustments", [&] { return ctx_.ledger->ListAdjustments(product_id); });
}

// ------------------------------------------------------------------
// Deletion
// ------------------------------------------------------------------

util::Outcome InventoryService::DeleteProduct(const std::string& product_id, bool force) {
  return Observe(ctx_, "InventoryService.DeleteProduct", [&] { ctx_.guard->DeleteProduct(product_id, force); });
}

util::OutcomeOf<model::Product> InventoryService::DeleteVariant(const std::string& product_id, const std::string& variant_id, bool force) {
  return Observe(ctx_, "InventoryService.DeleteVariant", [&] { return ctx_.guard->DeleteVariant(product_id, variant_id, force); });
}

util::OutcomeOf<core::BulkDeleteResult> InventoryService::BulkDeleteProducts(const std::vector<std::string>& product_ids) {
  return Observe(ctx_, "InventoryService.BulkDeleteProducts", [&] { return ctx_.guard->BulkDeleteProducts(product_ids); });
}

util::OutcomeOf<core::RestoreResult> InventoryService::RestoreDeletedProducts(const std::vector<model::SaleLine>& lines) {
  return Observe(ctx_, "InventoryService.RestoreDeletedProducts", [&] { return ctx_.guard->RestoreDeletedProducts(lines); });
}

util::OutcomeOf<std::vector<model::DeletionRecord>> InventoryService::ListDeletionRecords() {
  return Observe(ctx_, "InventoryService.ListDeletionRecords", [&] { return ctx_.guard->ListDeletionRecords(); });
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

util::OutcomeOf<std::vector<model::Notification>> InventoryService::ListNotifications() {
  return Observe(ctx_, "InventoryService.ListNotifications", [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.notifier->List(*tx, ctx_.identity->TenantId());
  });
}

util::Outcome InventoryService::MarkNotificationRead(const std::string& notification_id) {
  return Observe(ctx_, "InventoryService.MarkNotificationRead", [&] {
    auto tx = ctx_.repository->Begin();
    ctx_.notifier->MarkRead(*tx, ctx_.identity->TenantId(), notification_id);
    tx->Commit();
  });
}

util::OutcomeOf<std::size_t> InventoryService::MarkAllNotificationsRead() {
  return Observe(ctx_, "InventoryService.MarkAllNotificationsRead", [&] {
    auto tx      = ctx_.repository->Begin();
    auto changed = ctx_.notifier->MarkAllRead(*tx, ctx_.identity->TenantId());
    tx->Commit();
    return changed;
  });
}

util::OutcomeOf<std::size_t> InventoryService::PruneNotifications(int days) {
  return Observe(ctx_, "InventoryService.PruneNotifications", [&] {
    auto tx      = ctx_.repository->Begin();
    auto removed = ctx_.notifier->Prune(*tx, ctx_.identity->TenantId(), days);
    tx->Commit();
    return removed;
  });
}

} // namespace stockroom::service
