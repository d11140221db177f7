#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/model/purchase_order.hpp"

namespace stockroom::core {

struct PurchaseOrderDraft {
  std::string                           supplier_id;
  std::string                           supplier_name;
  std::optional<util::TimePoint>        date_expected;
  std::vector<model::PurchaseOrderLine> items;
  std::string                           notes;
};

struct ReceiptLine {
  std::string                product_id;
  std::optional<std::string> variant_id;
  model::Quantity            quantity = 0;
};

/*
  Purchase order lifecycle: Pending -> Partial -> Received.

  Status is derived from the lines after every receipt; quantity_received
  only grows. Receipts are not clamped to the ordered quantity.
*/
class PurchaseOrders {
 public:
  explicit PurchaseOrders(CoreContext ctx);

  model::PurchaseOrder AddPurchaseOrder(const PurchaseOrderDraft& draft);

  // Each receipt raises stock by its quantity and the matching line's
  // quantity_received. ValidationError for a negative quantity or a receipt
  // that matches no line.
  model::PurchaseOrder ReceiveItems(const std::string& po_id, const std::vector<ReceiptLine>& receipts);

  // Only while Pending.
  void DeletePurchaseOrder(const std::string& po_id);

  // Removes orders created more than `days` ago. Returns the number removed.
  std::size_t PrunePurchaseOrders(int days);

  std::vector<model::PurchaseOrder> ListPurchaseOrders();
  model::PurchaseOrder              GetPurchaseOrder(const std::string& po_id);

 private:
  CoreContext ctx_;
  StockLedger ledger_;
};

} // namespace stockroom::core
