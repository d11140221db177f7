#include "ledger_reason.hpp"

namespace stockroom::core {

std::string SaleReason(const std::string& public_ref) {
  return "Sale #" + public_ref;
}

std::string PurchaseOrderReason(const std::string& public_ref) {
  return "Received from PO #" + public_ref;
}

bool BelongsToSale(const model::StockAdjustment& row, const model::Sale& sale) {
  if (row.source == model::LedgerSource::kSale) {
    return row.source_id == sale.id;
  }
  if (row.source != model::LedgerSource::kManual) {
    return false;
  }
  if (!sale.public_ref.empty() && row.reason == SaleReason(sale.public_ref)) {
    return true;
  }
  return row.reason == SaleReason(sale.id);
}

} // namespace stockroom::core
