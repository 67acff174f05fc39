#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace mprisrelay::db {

/*
  Outcome of a trust-record write.

  Backends fold their native failures into these codes so the credential
  store can answer the same way for SQLite and the in-memory store.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,
  ReadOnly,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ReadOnly: return "read-only transaction";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::IOError: return "i/o error";
    case ErrorCode::Corruption: return "corrupt database";
    case ErrorCode::InternalError: return "internal error";
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

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Raises the util error matching `result`; `what` names the operation.
inline void ThrowIfError(const Result& result, const std::string& what) {
  if (result) {
    return;
  }
  std::string message = what + ": " + ToString(result.code);
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }
  switch (result.code) {
    case ErrorCode::NotFound: throw util::NotFound(message);
    case ErrorCode::Busy: throw util::Unavailable(message);
    case ErrorCode::ConstraintViolation: throw util::InvalidArgument(message);
    default: throw std::runtime_error(message);
  }
}

} // namespace mprisrelay::db
