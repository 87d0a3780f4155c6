#pragma once

#include <string>
#include <utility>

namespace resync::db {

// Backend-neutral outcome of a repository write. SQLite and libpqxx errors
// are translated into these codes inside the backends; ThrowIfDbError
// (db_errors.hpp) lifts them into the util exception family.
enum class ErrorCode {
  OK = 0,

  // row-level
  NotFound,
  AlreadyExists,
  ConstraintViolation,

  // concurrency: the caller may retry the whole transaction
  Conflict,
  SerializationFailure,
  Busy,

  // storage-level
  IOError,
  Corruption,
  InternalError,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal_error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace resync::db
