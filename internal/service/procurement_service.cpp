#include "procurement_service.hpp"

#include "observe.hpp"

namespace stockroom::service {

ProcurementService::ProcurementService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

util::OutcomeOf<model::PurchaseOrder> ProcurementService::AddPurchaseOrder(const core::PurchaseOrderDraft& draft) {
  return Observe(ctx_, "ProcurementService.AddPurchaseOrder", [&] { return ctx_.purchase_orders->AddPurchaseOrder(draft); });
}

util::OutcomeOf<model::PurchaseOrder> ProcurementService::ReceiveItems(const std::string& po_id, const std::vector<core::ReceiptLine>& receipts) {
  return Observe(ctx_, "ProcurementService.ReceiveItems", [&] { return ctx_.purchase_orders->ReceiveItems(po_id, receipts); });
}

util::Outcome ProcurementService::DeletePurchaseOrder(const std::string& po_id) {
  return Observe(ctx_, "ProcurementService.DeletePurchaseOrder", [&] { ctx_.purchase_orders->DeletePurchaseOrder(po_id); });
}

util::OutcomeOf<std::size_t> ProcurementService::PrunePurchaseOrders(int days) {
  return Observe(ctx_, "ProcurementService.PrunePurchaseOrders", [&] { return ctx_.purchase_orders->PrunePurchaseOrders(days); });
}

util::OutcomeOf<std::vector<model::PurchaseOrder>> ProcurementService::ListPurchaseOrders() {
  return Observe(ctx_, "ProcurementService.ListPurchaseOrders", [&] { return ctx_.purchase_orders->ListPurchaseOrders(); });
}

util::OutcomeOf<model::PurchaseOrder> ProcurementService::GetPurchaseOrder(const std::string& po_id) {
  return Observe(ctx_, "ProcurementService.GetPurchaseOrder", [&] { return ctx_.purchase_orders->GetPurchaseOrder(po_id); });
}

} // namespace stockroom::service
