#pragma once

#include <stdexcept>
#include <string>

namespace stockroom::util {

/*
  Central error types.

  Core components throw these; the service facades translate them into
  Outcome codes (see outcome.hpp).
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AccessDenied : public std::runtime_error {
 public:
  explicit AccessDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PreconditionFailed : public std::runtime_error {
 public:
  explicit PreconditionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoActiveShift : public std::runtime_error {
 public:
  explicit NoActiveShift(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Concurrent writer committed first; the caller may retry.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised when a stored aggregate no longer satisfies its own invariants
// (e.g. product stock != variant sum after a write). Never converted into a
// caller-facing validation failure.
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {
  }
};

} // namespace stockroom::util
