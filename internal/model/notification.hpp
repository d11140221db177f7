#pragma once

#include <cstdint>
#include <string>

#include "internal/model/types.hpp"

namespace stockroom::model {

enum class NotificationCategory : std::uint8_t {
  kStock         = 1,
  kPurchaseOrder = 2,
  kShift         = 3,
};

struct Notification {
  std::string          id;
  std::string          tenant_id;
  util::TimePoint      timestamp{};
  NotificationCategory category = NotificationCategory::kStock;
  std::string          message;
  bool                 is_read = false;
  std::string          related_id; // product, variant or PO id; may be empty
};

} // namespace stockroom::model
