#include "check_lock_client.hpp"

#include <stdexcept>

namespace resync::lock {

using namespace resync::v1;

CheckLockClient::CheckLockClient(std::shared_ptr<connectivity::ConnectivityMonitor> monitor, std::shared_ptr<LockAuthority> cloud,
                                 std::shared_ptr<LockAuthority> relay_host, std::shared_ptr<LockAuthority> local)
    : monitor_(std::move(monitor)), cloud_(std::move(cloud)), relay_host_(std::move(relay_host)), local_(std::move(local)) {
  if (!monitor_ || !local_) {
    throw std::invalid_argument("CheckLockClient requires a connectivity monitor and a local lock manager");
  }
}

CheckLockClient::Route CheckLockClient::Select() const {
  switch (monitor_->Mode()) {
    case CONNECTION_MODE_ONLINE:
      if (cloud_) return {cloud_.get(), false};
      break;
    case CONNECTION_MODE_LAN_DEGRADED:
      if (relay_host_) return {relay_host_.get(), false};
      break;
    default:
      break;
  }
  return {local_.get(), true};
}

AcquireLockResponse CheckLockClient::Acquire(const AcquireLockRequest& req) {
  const auto route = Select();
  auto       resp  = route.authority->Acquire(req);
  resp.set_local_only(route.local);
  return resp;
}

ReleaseLockResponse CheckLockClient::Release(const ReleaseLockRequest& req) {
  return Select().authority->Release(req);
}

OverrideLockResponse CheckLockClient::Override(const OverrideLockRequest& req) {
  return Select().authority->Override(req);
}

GetLockStatusResponse CheckLockClient::GetLockStatus(const GetLockStatusRequest& req) {
  return Select().authority->GetLockStatus(req);
}

GetConflictResponse CheckLockClient::GetConflict(const GetConflictRequest& req) {
  return Select().authority->GetConflict(req);
}

ResolveConflictResponse CheckLockClient::ResolveConflict(const ResolveConflictRequest& req) {
  return Select().authority->ResolveConflict(req);
}

ListConflictsResponse CheckLockClient::ListConflicts(const ListConflictsRequest& req) {
  return Select().authority->ListConflicts(req);
}

} // namespace resync::lock
