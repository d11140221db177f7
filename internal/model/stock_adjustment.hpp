#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/types.hpp"

namespace stockroom::model {

// What produced a ledger row. Lets cleanup find a transaction's rows without
// parsing reason text.
enum class LedgerSource : std::uint8_t {
  kManual        = 0,
  kSale          = 1,
  kPurchaseOrder = 2,
  kRestore       = 3,
};

/*
  Immutable ledger entry. Removed only as referential cleanup when the owning
  transaction or product is deleted.
*/
struct StockAdjustment {
  std::string                id;
  std::string                tenant_id;
  std::string                product_id;
  std::optional<std::string> variant_id;

  Quantity    quantity = 0; // signed delta
  std::string reason;

  LedgerSource source = LedgerSource::kManual;
  std::string  source_id;

  util::TimePoint created_at{};
};

} // namespace stockroom::model
