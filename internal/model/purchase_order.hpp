#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/types.hpp"

namespace stockroom::model {

// Monotonic: Pending -> Partial -> Received. Derived from the lines.
enum class PurchaseOrderStatus : std::uint8_t {
  kPending  = 1,
  kPartial  = 2,
  kReceived = 3,
};

struct PurchaseOrderLine {
  std::string                product_id;
  std::optional<std::string> variant_id;
  std::string                name;

  Quantity quantity_ordered  = 0;
  Quantity quantity_received = 0; // never decreases
  Money    cost_price        = 0; // snapshot at order time
};

struct PurchaseOrder {
  std::string id;
  std::string tenant_id;
  std::string public_ref; // PO-XXXXXX

  std::string supplier_id;
  std::string supplier_name;

  util::TimePoint                date_created{};
  std::optional<util::TimePoint> date_expected;

  std::vector<PurchaseOrderLine> items;
  Money                          total_cost = 0;
  std::string                    notes;

  PurchaseOrderStatus status = PurchaseOrderStatus::kPending;
};

inline Money ComputeTotalCost(const PurchaseOrder& po) {
  Money total = 0;
  for (const auto& line : po.items) {
    total += line.quantity_ordered * line.cost_price;
  }
  return total;
}

inline PurchaseOrderStatus DerivePurchaseOrderStatus(const PurchaseOrder& po) {
  bool     all_received   = true;
  Quantity total_received = 0;
  for (const auto& line : po.items) {
    total_received += line.quantity_received;
    if (line.quantity_received < line.quantity_ordered) all_received = false;
  }
  if (all_received && !po.items.empty()) return PurchaseOrderStatus::kReceived;
  if (total_received > 0) return PurchaseOrderStatus::kPartial;
  return PurchaseOrderStatus::kPending;
}

} // namespace stockroom::model
