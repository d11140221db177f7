#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/core/core_context.hpp"
#include "internal/model/shift.hpp"

namespace stockroom::db {
class Transaction;
}

namespace stockroom::core {

/*
  Cash drawer sessions.

  At most one shift per tenant is Open. Its cash totals move only through
  RecordCash(), which SaleProcessor calls inside the sale's transaction.
*/
class ShiftRegister {
 public:
  explicit ShiftRegister(CoreContext ctx);

  // Returns the already open shift unchanged when there is one.
  model::Shift OpenShift(model::Money start_float);

  // NoActiveShift when nothing is open.
  model::Shift CloseShift(model::Money actual_cash, const std::string& notes);

  std::optional<model::Shift> CurrentShift();
  std::vector<model::Shift>   ListShifts();

  // Positive amounts count as cash sales, negative as cash refunds. No-op
  // without an open shift or for a zero amount.
  void RecordCash(db::Transaction& tx, const std::string& tenant_id, model::Money cash);

 private:
  CoreContext ctx_;
};

} // namespace stockroom::core
