#pragma once

#include <string>
#include <string_view>

#include "internal/model/sale.hpp"
#include "internal/model/stock_adjustment.hpp"

namespace stockroom::core {

inline constexpr std::string_view kStockReceivedReason = "Stock Received";
inline constexpr std::string_view kImportedReason      = "Imported";

std::string SaleReason(const std::string& public_ref);
std::string PurchaseOrderReason(const std::string& public_ref);

/*
  True when a ledger row was written for `sale`.

  Rows written by this code carry {kSale, sale.id}. Older rows only carry
  reason text, either "Sale #<public ref>" or "Sale #<sale id>"; both are
  matched exactly.
*/
bool BelongsToSale(const model::StockAdjustment& row, const model::Sale& sale);

} // namespace stockroom::core
