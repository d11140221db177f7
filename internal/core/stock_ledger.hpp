#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/model/product.hpp"
#include "internal/model/stock_adjustment.hpp"

namespace stockroom::db {
class Transaction;
}

namespace stockroom::core {

struct StockChange {
  std::string                product_id;
  std::optional<std::string> variant_id;
  model::Quantity            new_level = 0;
  std::string                reason;
  model::LedgerSource        source = model::LedgerSource::kManual;
  std::string                source_id;
};

/*
  Authoritative stock levels plus the append-only ledger.

  Every level change goes through Apply(): the target's stock is set, the
  product total is recomputed from its variants, and one StockAdjustment is
  written, all inside the caller's transaction. Threshold notifications fire
  only when a change crosses the low-stock line or zero.
*/
class StockLedger {
 public:
  explicit StockLedger(CoreContext ctx);

  // Own unit of work. Returns the ledger row, or nullopt when the level
  // did not change.
  std::optional<model::StockAdjustment> AdjustStock(const StockChange& change);
  std::optional<model::StockAdjustment> ReceiveStock(const std::string& product_id, const std::optional<std::string>& variant_id,
                                                     model::Quantity quantity);

  std::vector<model::StockAdjustment> ListAdjustments(const std::optional<std::string>& product_id);

  // Caller's unit of work. NotFound for a missing product or variant.
  std::optional<model::StockAdjustment> Apply(db::Transaction& tx, const std::string& tenant_id, const StockChange& change);

  // Apply() relative to the current level.
  std::optional<model::StockAdjustment> Move(db::Transaction& tx, const std::string& tenant_id, const std::string& product_id,
                                              const std::optional<std::string>& variant_id, model::Quantity delta, std::string reason,
                                              model::LedgerSource source, std::string source_id);

  // Current level of the product or variant; nullopt if the variant is unknown.
  static std::optional<model::Quantity> LevelOf(const model::Product& product, const std::optional<std::string>& variant_id);

 private:
  void NotifyThresholdCrossing(db::Transaction& tx, const model::Product& product, const model::Variant* variant, model::Quantity old_level,
                               model::Quantity new_level);

  CoreContext ctx_;
};

} // namespace stockroom::core
