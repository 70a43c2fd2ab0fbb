#pragma once

#include <string>
#include <string_view>

namespace coolrouter::db {

/*
  Portable DB result codes.

  Backends translate their own errors into these; the broker maps them
  onto util::RouterError categories and never sees pqxx/sqlite types.

  BoundsExceeded  record violates model/limits.hpp (checked before any write)
  Conflict        stale version, or an update that rewrites stored votes
  ReadOnly        write attempted inside a read-only transaction
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,
  ReadOnly,

  ConstraintViolation,
  BoundsExceeded,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ReadOnly:
      return "read_only";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::BoundsExceeded:
      return "bounds_exceeded";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
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

} // namespace coolrouter::db
