#include "error_mapping.hpp"

#include "internal/util/errors.hpp"

namespace stockroom::service {

util::OutcomeCode ToOutcomeCode(const std::exception& e) {
  using namespace stockroom::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return OutcomeCode::Validation;
  }
  if (dynamic_cast<const AccessDenied*>(&e)) {
    return OutcomeCode::AccessDenied;
  }
  if (dynamic_cast<const PreconditionFailed*>(&e)) {
    return OutcomeCode::PreconditionFailed;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return OutcomeCode::NotFound;
  }
  if (dynamic_cast<const NoActiveShift*>(&e)) {
    return OutcomeCode::NoActiveShift;
  }
  // A duplicate key reaching the facade is a caller-side clash.
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return OutcomeCode::Validation;
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return OutcomeCode::Conflict;
  }
  // A broken stock invariant is a defect, not a caller error. The unit of
  // work has already rolled back.
  if (dynamic_cast<const InvariantViolation*>(&e)) {
    return OutcomeCode::Internal;
  }

  return OutcomeCode::Internal;
}

} // namespace stockroom::service
