#pragma once

#include <string>
#include <string_view>

namespace registrar::db {

// Store outcome for a single write. Backends map their native errors onto
// these codes; core code never sees a sqlite error number.
enum class ErrorCode {
  OK = 0,

  NotFound,
  // Unique key already taken (student id, course code, enrollment tuple).
  AlreadyExists,
  // A constraint other than a unique key rejected the row.
  ConstraintViolation,
  // Another writer holds the store; the unit of work may be rerun.
  Busy,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
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

  bool IsDuplicate() const {
    return code == ErrorCode::AlreadyExists || code == ErrorCode::ConstraintViolation;
  }

  bool IsRetryable() const {
    return code == ErrorCode::Busy;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace registrar::db
