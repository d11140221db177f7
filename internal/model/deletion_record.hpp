#pragma once

#include <string>
#include <string_view>

#include "internal/model/types.hpp"

namespace stockroom::model {

/*
  Tombstone consumed by downstream synchronization.

  Append-only; removed only when the entity it names is restored.
*/
struct DeletionRecord {
  std::string     id;
  std::string     tenant_id;
  std::string     table;
  util::TimePoint deleted_at{};
};

namespace tables {
inline constexpr std::string_view kProducts         = "products";
inline constexpr std::string_view kProductVariants  = "product_variants";
inline constexpr std::string_view kStockAdjustments = "stock_adjustments";
inline constexpr std::string_view kNotifications    = "notifications";
inline constexpr std::string_view kSales            = "sales";
inline constexpr std::string_view kPurchaseOrders   = "purchase_orders";
} // namespace tables

} // namespace stockroom::model
