#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/identity/identity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/error_mapping.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/outcome.hpp"

namespace stockroom::service {

/*
  Runs one facade operation under a span tagged with the tenant and actor,
  times it, records the outcome metric and converts exceptions into an
  Outcome. Log lines emitted inside carry tenant= and actor=.

  Typed rejections are logged at warn, anything else at error. The unit of
  work inside `fn` rolls back through its transaction's destructor.
*/
template <typename Fn>
auto Observe(const ServiceContext& ctx, std::string_view operation, Fn&& fn) {
  using Value   = std::invoke_result_t<Fn>;
  using Outcome = std::conditional_t<std::is_void_v<Value>, util::Outcome, util::OutcomeOf<Value>>;

  const auto tenant_id = ctx.identity->TenantId();
  const auto actor     = ctx.identity->CurrentActor();

  observability::ScopedLogContext log_context(tenant_id, actor.id);
  observability::SpanScope        span(operation);
  span.SetAttribute("stockroom.tenant_id", tenant_id);
  span.SetAttribute("stockroom.actor_id", actor.id);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](util::OutcomeCode code) {
    observability::Metrics::Instance().RecordOperation(operation, util::OutcomeCodeName(code));
    observability::Metrics::Instance().ObserveOperationLatencyMs(
        operation, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<Value>) {
      fn();
      finish(util::OutcomeCode::OK);
      return Outcome::Ok();
    } else {
      auto value = fn();
      finish(util::OutcomeCode::OK);
      return Outcome::Ok(std::move(value));
    }
  } catch (const std::exception& ex) {
    const auto code = ToOutcomeCode(ex);
    span.RecordException(ex.what());
    if (code == util::OutcomeCode::Internal) {
      STOCKROOM_LOG_ERROR("operation failed", {observability::StringField("operation", operation), observability::StringField("error", ex.what())});
    } else {
      STOCKROOM_LOG_WARN("operation rejected", {observability::StringField("operation", operation),
                                                observability::StringField("outcome", util::OutcomeCodeName(code)),
                                                observability::StringField("error", ex.what())});
    }
    finish(code);
    return Outcome::Err(code, ex.what());
  }
}

} // namespace stockroom::service
