#pragma once

#include <string>
#include <vector>

#include "internal/core/purchase_orders.hpp"
#include "internal/util/outcome.hpp"
#include "service_context.hpp"

namespace stockroom::service {

class ProcurementService {
 public:
  explicit ProcurementService(ServiceContext ctx);

  util::OutcomeOf<model::PurchaseOrder>              AddPurchaseOrder(const core::PurchaseOrderDraft& draft);
  util::OutcomeOf<model::PurchaseOrder>              ReceiveItems(const std::string& po_id, const std::vector<core::ReceiptLine>& receipts);
  util::Outcome                                      DeletePurchaseOrder(const std::string& po_id);
  util::OutcomeOf<std::size_t>                       PrunePurchaseOrders(int days);
  util::OutcomeOf<std::vector<model::PurchaseOrder>> ListPurchaseOrders();
  util::OutcomeOf<model::PurchaseOrder>              GetPurchaseOrder(const std::string& po_id);

 private:
  ServiceContext ctx_;
};

} // namespace stockroom::service
