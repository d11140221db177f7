#include "names.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace stockroom::model {

namespace {

template <typename Enum, std::size_t N>
std::string_view Lookup(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
  for (const auto& [key, name] : table) {
    if (key == value) return name;
  }
  throw std::invalid_argument("unmapped enum value");
}

template <typename Enum, std::size_t N>
Enum Parse(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view value, std::string_view what) {
  for (const auto& [key, name] : table) {
    if (name == value) return key;
  }
  throw std::invalid_argument("unknown " + std::string(what) + ": " + std::string(value));
}

constexpr std::array<std::pair<SaleType, std::string_view>, 2> kSaleTypes{{
    {SaleType::kSale, "Sale"},
    {SaleType::kReturn, "Return"},
}};

constexpr std::array<std::pair<SaleStatus, std::string_view>, 3> kSaleStatuses{{
    {SaleStatus::kCompleted, "Completed"},
    {SaleStatus::kPartiallyRefunded, "Partially Refunded"},
    {SaleStatus::kRefunded, "Refunded"},
}};

constexpr std::array<std::pair<PaymentType, std::string_view>, 3> kPaymentTypes{{
    {PaymentType::kCash, "Cash"},
    {PaymentType::kCard, "Card"},
    {PaymentType::kOther, "Other"},
}};

constexpr std::array<std::pair<PurchaseOrderStatus, std::string_view>, 3> kPurchaseOrderStatuses{{
    {PurchaseOrderStatus::kPending, "Pending"},
    {PurchaseOrderStatus::kPartial, "Partial"},
    {PurchaseOrderStatus::kReceived, "Received"},
}};

constexpr std::array<std::pair<ShiftStatus, std::string_view>, 2> kShiftStatuses{{
    {ShiftStatus::kOpen, "Open"},
    {ShiftStatus::kClosed, "Closed"},
}};

constexpr std::array<std::pair<NotificationCategory, std::string_view>, 3> kNotificationCategories{{
    {NotificationCategory::kStock, "STOCK"},
    {NotificationCategory::kPurchaseOrder, "PO"},
    {NotificationCategory::kShift, "SHIFT"},
}};

constexpr std::array<std::pair<LedgerSource, std::string_view>, 4> kLedgerSources{{
    {LedgerSource::kManual, "manual"},
    {LedgerSource::kSale, "sale"},
    {LedgerSource::kPurchaseOrder, "purchase_order"},
    {LedgerSource::kRestore, "restore"},
}};

constexpr std::array<std::pair<PriceType, std::string_view>, 2> kPriceTypes{{
    {PriceType::kRetail, "retail"},
    {PriceType::kCost, "cost"},
}};

} // namespace

std::string_view ToString(SaleType type) { return Lookup(kSaleTypes, type); }
std::string_view ToString(SaleStatus status) { return Lookup(kSaleStatuses, status); }
std::string_view ToString(PaymentType type) { return Lookup(kPaymentTypes, type); }
std::string_view ToString(PurchaseOrderStatus status) { return Lookup(kPurchaseOrderStatuses, status); }
std::string_view ToString(ShiftStatus status) { return Lookup(kShiftStatuses, status); }
std::string_view ToString(NotificationCategory category) { return Lookup(kNotificationCategories, category); }
std::string_view ToString(LedgerSource source) { return Lookup(kLedgerSources, source); }
std::string_view ToString(PriceType type) { return Lookup(kPriceTypes, type); }

SaleType ParseSaleType(std::string_view value) { return Parse(kSaleTypes, value, "sale type"); }
SaleStatus ParseSaleStatus(std::string_view value) { return Parse(kSaleStatuses, value, "sale status"); }
PaymentType ParsePaymentType(std::string_view value) { return Parse(kPaymentTypes, value, "payment type"); }
PurchaseOrderStatus ParsePurchaseOrderStatus(std::string_view value) { return Parse(kPurchaseOrderStatuses, value, "purchase order status"); }
ShiftStatus ParseShiftStatus(std::string_view value) { return Parse(kShiftStatuses, value, "shift status"); }
NotificationCategory ParseNotificationCategory(std::string_view value) { return Parse(kNotificationCategories, value, "notification category"); }
LedgerSource ParseLedgerSource(std::string_view value) { return Parse(kLedgerSources, value, "ledger source"); }
PriceType ParsePriceType(std::string_view value) { return Parse(kPriceTypes, value, "price type"); }

} // namespace stockroom::model
