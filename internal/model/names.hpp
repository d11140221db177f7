#pragma once

#include <string>
#include <string_view>

#include "internal/model/notification.hpp"
#include "internal/model/purchase_order.hpp"
#include "internal/model/sale.hpp"
#include "internal/model/shift.hpp"
#include "internal/model/stock_adjustment.hpp"

namespace stockroom::model {

/*
  Stable string forms of the model enums. Used for persistence and for
  user-facing messages, so the spellings must not change.
*/

std::string_view ToString(SaleType type);
std::string_view ToString(SaleStatus status);
std::string_view ToString(PaymentType type);
std::string_view ToString(PurchaseOrderStatus status);
std::string_view ToString(ShiftStatus status);
std::string_view ToString(NotificationCategory category);
std::string_view ToString(LedgerSource source);
std::string_view ToString(PriceType type);

// Throw std::invalid_argument on unknown spellings.
SaleType             ParseSaleType(std::string_view value);
SaleStatus           ParseSaleStatus(std::string_view value);
PaymentType          ParsePaymentType(std::string_view value);
PurchaseOrderStatus  ParsePurchaseOrderStatus(std::string_view value);
ShiftStatus          ParseShiftStatus(std::string_view value);
NotificationCategory ParseNotificationCategory(std::string_view value);
LedgerSource         ParseLedgerSource(std::string_view value);
PriceType            ParsePriceType(std::string_view value);

} // namespace stockroom::model
