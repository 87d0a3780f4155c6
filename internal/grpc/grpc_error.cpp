#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resync::grpc {

namespace {

template <typename... Errors>
bool IsAnyOf(const std::exception& e) {
  return ((dynamic_cast<const Errors*>(&e) != nullptr) || ...);
}

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace resync::util;

  if (IsAnyOf<NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  if (IsAnyOf<AlreadyExists>(e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  // A stale revision or a lost lock: the caller re-reads and retries.
  if (IsAnyOf<LockConflict>(e)) return ::grpc::StatusCode::ABORTED;
  if (IsAnyOf<InvalidState>(e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (IsAnyOf<Unauthorized>(e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  if (IsAnyOf<InvalidArgument, ConfigError>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  // CircuitOpen derives from Unavailable.
  if (IsAnyOf<Unavailable>(e)) return ::grpc::StatusCode::UNAVAILABLE;
  if (IsAnyOf<ResourceExhausted>(e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  const auto code = CodeFor(e);
  if (code == ::grpc::StatusCode::INTERNAL) {
    RESYNC_LOG_ERROR("Unclassified error reached the RPC boundary", {observability::StringField("error", e.what())});
  }
  return {code, e.what()};
}

} // namespace resync::grpc
