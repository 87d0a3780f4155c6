#pragma once

#include <memory>

#include "internal/connectivity/connectivity_monitor.hpp"
#include "lock_authority.hpp"

namespace resync::lock {

/*
  Terminal-side lock access routed by connection mode.

    online        -> cloud authority
    lan-degraded  -> relay host authority
    local-only    -> local manager, grants flagged local_only
    isolated      -> local manager, grants flagged local_only

  A missing remote authority falls back to the local manager.
*/
class CheckLockClient final : public LockAuthority {
 public:
  CheckLockClient(std::shared_ptr<connectivity::ConnectivityMonitor> monitor, std::shared_ptr<LockAuthority> cloud,
                  std::shared_ptr<LockAuthority> relay_host, std::shared_ptr<LockAuthority> local);

  resync::v1::AcquireLockResponse   Acquire(const resync::v1::AcquireLockRequest& req) override;
  resync::v1::ReleaseLockResponse   Release(const resync::v1::ReleaseLockRequest& req) override;
  resync::v1::OverrideLockResponse  Override(const resync::v1::OverrideLockRequest& req) override;
  resync::v1::GetLockStatusResponse GetLockStatus(const resync::v1::GetLockStatusRequest& req) override;

  resync::v1::GetConflictResponse     GetConflict(const resync::v1::GetConflictRequest& req) override;
  resync::v1::ResolveConflictResponse ResolveConflict(const resync::v1::ResolveConflictRequest& req) override;
  resync::v1::ListConflictsResponse   ListConflicts(const resync::v1::ListConflictsRequest& req) override;

 private:
  struct Route {
    LockAuthority* authority;
    bool           local;
  };

  Route Select() const;

  std::shared_ptr<connectivity::ConnectivityMonitor> monitor_;
  std::shared_ptr<LockAuthority>                     cloud_;
  std::shared_ptr<LockAuthority>                     relay_host_;
  std::shared_ptr<LockAuthority>                     local_;
};

} // namespace resync::lock
