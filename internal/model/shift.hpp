#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/types.hpp"

namespace stockroom::model {

enum class ShiftStatus : std::uint8_t {
  kOpen   = 1,
  kClosed = 2,
};

/*
  One cash-drawer session. At most one Open shift per tenant; the open shift
  is found by querying on status, never cached.
*/
struct Shift {
  std::string id;
  std::string tenant_id;

  std::string     opened_by_id;
  std::string     opened_by_name;
  util::TimePoint start_time{};
  Money           start_float = 0;

  // Running totals fed by completed sales only.
  Money cash_sales   = 0;
  Money cash_refunds = 0;

  ShiftStatus status = ShiftStatus::kOpen;

  std::string                    closed_by_id;
  std::string                    closed_by_name;
  std::optional<util::TimePoint> end_time;
  std::optional<Money>           expected_cash;
  std::optional<Money>           actual_cash;
  std::optional<Money>           difference;
  std::string                    notes;
};

inline Money ExpectedCash(const Shift& shift) {
  return shift.start_float + shift.cash_sales - shift.cash_refunds;
}

} // namespace stockroom::model
