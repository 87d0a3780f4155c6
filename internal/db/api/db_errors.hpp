#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace resync::db {

// Maps a failed repository Result onto the util error hierarchy so the
// gRPC layer can report it. Retryable codes surface as LockConflict or
// Unavailable, which clients treat as "try again".
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }

  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw util::LockConflict(message);
    case ErrorCode::Busy:
    case ErrorCode::IOError:
      throw util::Unavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace resync::db
