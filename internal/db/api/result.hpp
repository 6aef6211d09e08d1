#pragma once

#include <string>
#include <utility>

namespace avatarpool::db {

/*
  Outcome of a repository call.

  Backends translate their native errors into ErrorCode; the pool and
  binding stores turn non-OK results into util exceptions.
*/
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  ConstraintViolation,
  Busy,
  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::IOError: return "i/o error";
    case ErrorCode::Corruption: return "corruption";
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

  // "<context>: <code name>[: <message>]"
  std::string Describe(const std::string& context) const {
    std::string out = context + ": " + ErrorCodeName(code);
    if (!message.empty()) out += ": " + message;
    return out;
  }
};

} // namespace avatarpool::db
