#include "shift_register.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/identity/identity.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace stockroom::core {

ShiftRegister::ShiftRegister(CoreContext ctx) : ctx_(std::move(ctx)) {
}

model::Shift ShiftRegister::OpenShift(model::Money start_float) {
  if (start_float < 0) {
    throw util::ValidationError("start float must be >= 0");
  }
  const auto tenant = ctx_.identity->TenantId();
  const auto actor  = ctx_.identity->CurrentActor();

  auto tx = ctx_.repository->Begin();
  if (auto open = ctx_.repository->FindOpenShift(*tx, tenant)) {
    STOCKROOM_LOG_INFO("shift already open", {observability::StringField("shift_id", open->id)});
    return *open;
  }

  model::Shift shift;
  shift.id             = util::PrefixedId("shift");
  shift.tenant_id      = tenant;
  shift.opened_by_id   = actor.id;
  shift.opened_by_name = actor.name;
  shift.start_time     = util::Now();
  shift.start_float    = start_float;
  shift.status         = model::ShiftStatus::kOpen;
  ThrowIfDbError(ctx_.repository->InsertShift(*tx, shift), "insert shift");

  if (ctx_.notifier) {
    ctx_.notifier->Emit(*tx, tenant, model::NotificationCategory::kShift,
                        "Shift started by " + actor.name + " with float " + model::FormatMoney(start_float), shift.id);
  }
  tx->Commit();

  STOCKROOM_LOG_INFO("shift opened", {observability::StringField("shift_id", shift.id), observability::IntField("start_float", start_float)});
  return shift;
}

model::Shift ShiftRegister::CloseShift(model::Money actual_cash, const std::string& notes) {
  const auto tenant = ctx_.identity->TenantId();
  const auto actor  = ctx_.identity->CurrentActor();

  auto tx    = ctx_.repository->Begin();
  auto shift = ctx_.repository->FindOpenShift(*tx, tenant);
  if (!shift) {
    throw util::NoActiveShift("no open shift to close");
  }

  const model::Money expected = model::ExpectedCash(*shift);

  shift->status         = model::ShiftStatus::kClosed;
  shift->closed_by_id   = actor.id;
  shift->closed_by_name = actor.name;
  shift->end_time       = util::Now();
  shift->expected_cash  = expected;
  shift->actual_cash    = actual_cash;
  shift->difference     = actual_cash - expected;
  shift->notes          = notes;
  ThrowIfDbError(ctx_.repository->UpdateShift(*tx, *shift), "close shift");

  if (ctx_.notifier) {
    ctx_.notifier->Emit(*tx, tenant, model::NotificationCategory::kShift,
                        "Shift closed by " + actor.name + ". Difference: " + model::FormatMoney(*shift->difference), shift->id);
  }
  tx->Commit();

  observability::Metrics::Instance().RecordShiftClose(*shift->difference);
  STOCKROOM_LOG_INFO("shift closed", {observability::StringField("shift_id", shift->id), observability::IntField("expected", expected),
                                      observability::IntField("actual", actual_cash), observability::IntField("difference", *shift->difference)});
  return *shift;
}

std::optional<model::Shift> ShiftRegister::CurrentShift() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->FindOpenShift(*tx, ctx_.identity->TenantId());
}

std::vector<model::Shift> ShiftRegister::ListShifts() {
  auto tx = ctx_.repository->Begin();
  return ctx_.repository->ListShifts(*tx, ctx_.identity->TenantId());
}

void ShiftRegister::RecordCash(db::Transaction& tx, const std::string& tenant_id, model::Money cash) {
  if (cash == 0) return;

  auto shift = ctx_.repository->FindOpenShift(tx, tenant_id);
  if (!shift) return;

  if (cash > 0) {
    shift->cash_sales += cash;
  } else {
    shift->cash_refunds += -cash;
  }
  ThrowIfDbError(ctx_.repository->UpdateShift(tx, *shift), "update shift totals");
}

} // namespace stockroom::core
