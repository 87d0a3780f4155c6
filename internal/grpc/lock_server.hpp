#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/lock_service.hpp"
#include "resync/v1/lock_service.grpc.pb.h"

namespace resync::grpc {

class LockServer final : public resync::v1::LockService::Service {
 public:
  explicit LockServer(std::shared_ptr<resync::service::LockService> svc);

  ::grpc::Status Acquire(::grpc::ServerContext*, const resync::v1::AcquireLockRequest*, resync::v1::AcquireLockResponse*) override;
  ::grpc::Status Release(::grpc::ServerContext*, const resync::v1::ReleaseLockRequest*, resync::v1::ReleaseLockResponse*) override;
  ::grpc::Status Override(::grpc::ServerContext*, const resync::v1::OverrideLockRequest*, resync::v1::OverrideLockResponse*) override;
  ::grpc::Status GetLockStatus(::grpc::ServerContext*, const resync::v1::GetLockStatusRequest*, resync::v1::GetLockStatusResponse*) override;
  ::grpc::Status GetConflict(::grpc::ServerContext*, const resync::v1::GetConflictRequest*, resync::v1::GetConflictResponse*) override;
  ::grpc::Status ResolveConflict(::grpc::ServerContext*, const resync::v1::ResolveConflictRequest*,
                                 resync::v1::ResolveConflictResponse*) override;
  ::grpc::Status ListConflicts(::grpc::ServerContext*, const resync::v1::ListConflictsRequest*, resync::v1::ListConflictsResponse*) override;

 private:
  std::shared_ptr<resync::service::LockService> service_;
};

} // namespace resync::grpc
