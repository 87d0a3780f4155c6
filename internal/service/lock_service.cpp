#include "lock_service.hpp"

#include <stdexcept>

#include "internal/lock/lock_authority.hpp"
#include "observe_rpc.hpp"

namespace resync::service {

using namespace resync::v1;

LockService::LockService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.locks) throw std::invalid_argument("LockService requires a lock authority");
}

AcquireLockResponse LockService::Acquire(const AcquireLockRequest& req) {
  return ObserveRpc("LockService.Acquire", [&] { return ctx_.locks->Acquire(req); });
}

ReleaseLockResponse LockService::Release(const ReleaseLockRequest& req) {
  return ObserveRpc("LockService.Release", [&] { return ctx_.locks->Release(req); });
}

OverrideLockResponse LockService::Override(const OverrideLockRequest& req) {
  return ObserveRpc("LockService.Override", [&] { return ctx_.locks->Override(req); });
}

GetLockStatusResponse LockService::GetLockStatus(const GetLockStatusRequest& req) {
  return ObserveRpc("LockService.GetLockStatus", [&] { return ctx_.locks->GetLockStatus(req); });
}

GetConflictResponse LockService::GetConflict(const GetConflictRequest& req) {
  return ObserveRpc("LockService.GetConflict", [&] { return ctx_.locks->GetConflict(req); });
}

ResolveConflictResponse LockService::ResolveConflict(const ResolveConflictRequest& req) {
  return ObserveRpc("LockService.ResolveConflict", [&] { return ctx_.locks->ResolveConflict(req); });
}

ListConflictsResponse LockService::ListConflicts(const ListConflictsRequest& req) {
  return ObserveRpc("LockService.ListConflicts", [&] { return ctx_.locks->ListConflicts(req); });
}

} // namespace resync::service
