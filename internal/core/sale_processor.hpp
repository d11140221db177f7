#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/core/shift_register.hpp"
#include "internal/core/stock_ledger.hpp"
#include "internal/model/sale.hpp"

namespace stockroom::db {
class Transaction;
}

namespace stockroom::core {

class DeletionPlan;

// One till line. Negative quantity returns units; original_sale_id links a
// return line to the sale it refunds.
struct CartLine {
  std::string                product_id;
  std::optional<std::string> variant_id;

  // Used when the product no longer exists; otherwise taken from the store.
  std::string  name;
  std::string  sku;
  model::Money cost_price = 0;

  model::Quantity quantity     = 0;
  model::Money    retail_price = 0; // price charged per unit

  std::optional<std::string> original_sale_id;
};

struct SaleRequest {
  std::vector<CartLine>       items;
  std::vector<model::Payment> payments;
};

/*
  Sale/return processing.

  ProcessSale() is one unit of work: stock moves for every line, refund
  bookkeeping on the original sales, shift cash totals and the new Sale row
  commit together or not at all.

  Sale status only moves forward: Completed -> Partially Refunded -> Refunded.
*/
class SaleProcessor {
 public:
  explicit SaleProcessor(CoreContext ctx);

  model::Sale ProcessSale(const SaleRequest& request);

  // Rejects returns (PreconditionFailed). Removes the sale, every return
  // referencing it, and their ledger rows. Returns the number of sale rows
  // removed.
  std::size_t DeleteSale(const std::string& sale_id);

  // Deletes Sale-type transactions (optionally only those in `statuses`)
  // with the DeleteSale cascade. Returns the number of sales selected.
  std::size_t ClearSales(const std::optional<std::vector<model::SaleStatus>>& statuses);
  std::size_t PruneSales(int days, const std::optional<std::vector<model::SaleStatus>>& statuses);

  std::vector<model::Sale> ListSales();
  model::Sale              GetSale(const std::string& sale_id);

 private:
  void Validate(const SaleRequest& request) const;
  void ApplyReturns(db::Transaction& tx, const std::string& tenant_id, model::Sale& sale);

  // Plans the removal of `sales` and everything that hangs off them.
  static void PlanCascade(const std::vector<model::Sale>& sales, const std::vector<model::Sale>& all_sales,
                          const std::vector<model::StockAdjustment>& ledger, DeletionPlan& plan);

  std::size_t DeleteMatching(const std::function<bool(const model::Sale&)>& selected);

  CoreContext   ctx_;
  StockLedger   ledger_;
  ShiftRegister shifts_;
};

} // namespace stockroom::core
