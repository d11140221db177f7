#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace stockroom::db {

/*
  Backend-neutral write status.

  Repositories translate SQLite result codes (or memory-store checks) into
  these; nothing above internal/db sees a backend error type.

    NotFound             update/delete of a missing row
    AlreadyExists        duplicate primary key
    ConstraintViolation  other uniqueness or foreign key failure
    Busy, Conflict       lock timeout / concurrent commit; safe to retry
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  ConstraintViolation,

  Busy,
  Conflict,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "internal_error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // The same unit of work may succeed when run again.
  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::Conflict || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace stockroom::db
