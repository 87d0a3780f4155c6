#pragma once

#include "resync/v1/lock_service.pb.h"
#include "service_context.hpp"

namespace resync::service {

class LockService {
 public:
  explicit LockService(ServiceContext ctx);

  resync::v1::AcquireLockResponse   Acquire(const resync::v1::AcquireLockRequest& req);
  resync::v1::ReleaseLockResponse   Release(const resync::v1::ReleaseLockRequest& req);
  resync::v1::OverrideLockResponse  Override(const resync::v1::OverrideLockRequest& req);
  resync::v1::GetLockStatusResponse GetLockStatus(const resync::v1::GetLockStatusRequest& req);

  resync::v1::GetConflictResponse     GetConflict(const resync::v1::GetConflictRequest& req);
  resync::v1::ResolveConflictResponse ResolveConflict(const resync::v1::ResolveConflictRequest& req);
  resync::v1::ListConflictsResponse   ListConflicts(const resync::v1::ListConflictsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace resync::service
