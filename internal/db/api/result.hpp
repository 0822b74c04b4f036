#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace coord::db {

/*
  Store outcome codes shared by every backend. Backends map their native
  errors onto these; the core never sees a sqlite return code.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  ConstraintViolation,

  // another writer holds the store; same call may be retried
  Busy,
  Conflict,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:                  return "ok";
    case ErrorCode::NotFound:            return "not_found";
    case ErrorCode::AlreadyExists:       return "already_exists";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::Busy:                return "busy";
    case ErrorCode::Conflict:            return "conflict";
    case ErrorCode::IOError:             return "io_error";
    case ErrorCode::Corruption:          return "corruption";
    case ErrorCode::InternalError:       return "internal_error";
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

  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::Conflict;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace coord::db
