#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace stockroom::model {

// Integer minor currency units (cents).
using Money = std::int64_t;

// Signed unit count. Negative sale lines are returns.
using Quantity = std::int64_t;

enum class PriceType : std::uint8_t {
  kRetail = 1,
  kCost   = 2,
};

struct PriceHistoryEntry {
  util::TimePoint date{};
  PriceType       price_type = PriceType::kRetail;
  Money           old_value  = 0;
  Money           new_value  = 0;
  std::string     actor_id;
  std::string     actor_name;
};

// 12345 -> "123.45", -5 -> "-0.05"
inline std::string FormatMoney(Money amount) {
  const bool negative = amount < 0;
  const auto absolute = negative ? -amount : amount;
  auto       cents    = std::to_string(absolute % 100);
  if (cents.size() < 2) cents.insert(cents.begin(), '0');
  return (negative ? "-" : "") + std::to_string(absolute / 100) + "." + cents;
}

} // namespace stockroom::model
