#pragma once

#include "resync/v1/lock_service.pb.h"

namespace resync::lock {

/*
  Check lock operations as served by a lock authority.

  Implemented by the in-process CheckLockManager, by the remote client for
  the cloud or relay host, and by CheckLockClient which routes between them
  by connection mode. Errors are thrown as util exceptions.
*/
class LockAuthority {
 public:
  virtual ~LockAuthority() = default;

  virtual resync::v1::AcquireLockResponse Acquire(const resync::v1::AcquireLockRequest& req) = 0;
  virtual resync::v1::ReleaseLockResponse Release(const resync::v1::ReleaseLockRequest& req) = 0;
  virtual resync::v1::OverrideLockResponse Override(const resync::v1::OverrideLockRequest& req) = 0;
  virtual resync::v1::GetLockStatusResponse GetLockStatus(const resync::v1::GetLockStatusRequest& req) = 0;

  virtual resync::v1::GetConflictResponse     GetConflict(const resync::v1::GetConflictRequest& req) = 0;
  virtual resync::v1::ResolveConflictResponse ResolveConflict(const resync::v1::ResolveConflictRequest& req) = 0;
  virtual resync::v1::ListConflictsResponse   ListConflicts(const resync::v1::ListConflictsRequest& req) = 0;
};

} // namespace resync::lock
