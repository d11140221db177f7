#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/product.hpp"
#include "internal/model/types.hpp"

namespace stockroom::model {

enum class SaleType : std::uint8_t {
  kSale   = 1,
  kReturn = 2,
};

// Monotonic: Completed -> PartiallyRefunded -> Refunded.
enum class SaleStatus : std::uint8_t {
  kCompleted         = 1,
  kPartiallyRefunded = 2,
  kRefunded          = 3,
};

enum class PaymentType : std::uint8_t {
  kCash  = 1,
  kCard  = 2,
  kOther = 3,
};

struct Payment {
  PaymentType type   = PaymentType::kCash;
  Money       amount = 0; // negative for refunds
};

// Line item with a snapshot of the product at time of sale.
struct SaleLine {
  std::string                product_id;
  std::optional<std::string> variant_id;

  std::string                name;
  std::string                sku;
  std::vector<VariantOption> variant_options;

  Quantity quantity          = 0; // negative = returned units
  Money    cost_price        = 0;
  Money    retail_price      = 0;
  Quantity returned_quantity = 0;

  std::optional<std::string> original_sale_id;
};

struct Sale {
  std::string id;
  std::string tenant_id;
  std::string public_ref; // TRX-XXXXXXXX / RET-XXXXXXXX

  SaleType        type = SaleType::kSale;
  util::TimePoint date{};

  std::vector<SaleLine> items;
  std::vector<Payment>  payments;

  Money total  = 0;
  Money cogs   = 0;
  Money profit = 0;

  SaleStatus status = SaleStatus::kCompleted;

  std::optional<std::string> original_sale_id;
  std::string                original_sale_public_ref;
  std::string                cashier_id;
};

inline bool SameTarget(const SaleLine& a, const std::string& product_id, const std::optional<std::string>& variant_id) {
  return a.product_id == product_id && a.variant_id == variant_id;
}

// Refunded iff every line has been returned in full; never regresses.
inline SaleStatus DeriveRefundStatus(const Sale& sale) {
  if (sale.status == SaleStatus::kRefunded) {
    return SaleStatus::kRefunded;
  }
  for (const auto& line : sale.items) {
    if (line.returned_quantity < line.quantity) {
      return SaleStatus::kPartiallyRefunded;
    }
  }
  return SaleStatus::kRefunded;
}

inline Money CashAmount(const Sale& sale) {
  Money cash = 0;
  for (const auto& payment : sale.payments) {
    if (payment.type == PaymentType::kCash) cash += payment.amount;
  }
  return cash;
}

inline bool ReferencesSale(const Sale& candidate, const std::string& sale_id) {
  if (candidate.original_sale_id == sale_id) return true;
  for (const auto& line : candidate.items) {
    if (line.original_sale_id == sale_id) return true;
  }
  return false;
}

} // namespace stockroom::model
