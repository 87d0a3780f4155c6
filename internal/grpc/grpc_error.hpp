#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace resync::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Runs a handler body, mapping any exception to its status.
template <typename Fn>
::grpc::Status Guard(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace resync::grpc
