#include <cassert>
#include <iostream>
#include <string>

#include "internal/core/shift_register.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using stockroom::core::ShiftRegister;
using stockroom::model::ShiftStatus;
using stockroom::testing::Fixture;
using stockroom::testing::Throws;

void TestOpenTwiceKeepsOriginal() {
  Fixture       fx;
  ShiftRegister shifts(fx.ctx);

  const auto first  = shifts.OpenShift(10000);
  const auto second = shifts.OpenShift(99999);

  assert(second.id == first.id);
  assert(second.start_float == 10000);
  assert(shifts.ListShifts().size() == 1);
  assert(fx.sink->delivered.size() == 1);
  assert(fx.sink->delivered[0].message == "Shift started by Alex with float 100.00");
}

void TestCloseReconcilesCash() {
  Fixture       fx;
  ShiftRegister shifts(fx.ctx);
  shifts.OpenShift(10000);

  {
    auto tx = fx.repository->Begin();
    shifts.RecordCash(*tx, "shop-1", 25000);
    shifts.RecordCash(*tx, "shop-1", -2000);
    shifts.RecordCash(*tx, "shop-1", 0);
    tx->Commit();
  }

  const auto closed = shifts.CloseShift(33000, "all good");
  assert(closed.status == ShiftStatus::kClosed);
  assert(closed.cash_sales == 25000);
  assert(closed.cash_refunds == 2000);
  assert(closed.expected_cash == 33000);
  assert(closed.actual_cash == 33000);
  assert(closed.difference == 0);
  assert(closed.notes == "all good");
  assert(closed.closed_by_name == "Alex");
  assert(closed.end_time.has_value());

  assert(!shifts.CurrentShift().has_value());
  assert(fx.sink->delivered.back().message == "Shift closed by Alex. Difference: 0.00");
}

void TestShortDrawerReportsNegativeDifference() {
  Fixture       fx;
  ShiftRegister shifts(fx.ctx);
  shifts.OpenShift(5000);

  const auto closed = shifts.CloseShift(4950, "");
  assert(closed.difference == -50);
  assert(fx.sink->delivered.back().message == "Shift closed by Alex. Difference: -0.50");
}

void TestCloseWithoutOpenShift() {
  Fixture       fx;
  ShiftRegister shifts(fx.ctx);

  assert(Throws<stockroom::util::NoActiveShift>([&] { shifts.CloseShift(100, ""); }));

  shifts.OpenShift(0);
  shifts.CloseShift(0, "");
  assert(Throws<stockroom::util::NoActiveShift>([&] { shifts.CloseShift(0, ""); }));

  // A new shift may open once the previous one closed.
  const auto next = shifts.OpenShift(2000);
  assert(next.status == ShiftStatus::kOpen);
  assert(shifts.ListShifts().size() == 2);
}

void TestRecordCashWithoutShiftIsIgnored() {
  Fixture       fx;
  ShiftRegister shifts(fx.ctx);

  auto tx = fx.repository->Begin();
  shifts.RecordCash(*tx, "shop-1", 500);
  tx->Commit();
  assert(shifts.ListShifts().empty());
}

void TestNegativeFloatRejected() {
  Fixture       fx;
  ShiftRegister shifts(fx.ctx);

  assert(Throws<stockroom::util::ValidationError>([&] { shifts.OpenShift(-1); }));
  assert(!shifts.CurrentShift().has_value());
}

} // namespace

int main() {
  TestOpenTwiceKeepsOriginal();
  TestCloseReconcilesCash();
  TestShortDrawerReportsNegativeDifference();
  TestCloseWithoutOpenShift();
  TestRecordCashWithoutShiftIsIgnored();
  TestNegativeFloatRejected();

  std::cout << "stockroom_unit_shift_register: pass\n";
  return 0;
}
