#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stockroom::util {

/*
  Caller-facing result of a service operation.

  Mirrors db::Result: a code plus a human readable message. Messages only
  mention ids the caller already supplied.
*/

enum class OutcomeCode {
  OK = 0,

  Validation,
  AccessDenied,
  PreconditionFailed,
  NotFound,
  NoActiveShift,
  Conflict,

  Internal
};

std::string_view OutcomeCodeName(OutcomeCode code);

struct Outcome {
  OutcomeCode code = OutcomeCode::OK;
  std::string message;

  static Outcome Ok(std::string msg = {}) {
    return {OutcomeCode::OK, std::move(msg)};
  }

  static Outcome Err(OutcomeCode c, std::string msg) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == OutcomeCode::OK;
  }
};

template <typename T>
struct OutcomeOf {
  OutcomeCode      code = OutcomeCode::OK;
  std::string      message;
  std::optional<T> value;

  static OutcomeOf Ok(T v, std::string msg = {}) {
    OutcomeOf out;
    out.value   = std::move(v);
    out.message = std::move(msg);
    return out;
  }

  static OutcomeOf Err(OutcomeCode c, std::string msg) {
    OutcomeOf out;
    out.code    = c;
    out.message = std::move(msg);
    return out;
  }

  explicit operator bool() const {
    return code == OutcomeCode::OK;
  }

  const T& operator*() const {
    return *value;
  }

  const T* operator->() const {
    return &*value;
  }
};

inline std::string_view OutcomeCodeName(OutcomeCode code) {
  switch (code) {
    case OutcomeCode::OK:
      return "ok";
    case OutcomeCode::Validation:
      return "validation_error";
    case OutcomeCode::AccessDenied:
      return "access_denied";
    case OutcomeCode::PreconditionFailed:
      return "precondition_failed";
    case OutcomeCode::NotFound:
      return "not_found";
    case OutcomeCode::NoActiveShift:
      return "no_active_shift";
    case OutcomeCode::Conflict:
      return "conflict";
    case OutcomeCode::Internal:
      return "internal";
  }
  return "internal";
}

} // namespace stockroom::util
