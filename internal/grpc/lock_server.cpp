#include "lock_server.hpp"

#include "grpc_error.hpp"

namespace resync::grpc {

using namespace resync::v1;

LockServer::LockServer(std::shared_ptr<resync::service::LockService> svc) : service_(std::move(svc)) {
}

::grpc::Status LockServer::Acquire(::grpc::ServerContext*, const AcquireLockRequest* req, AcquireLockResponse* resp) {
  return Guard([&] { *resp = service_->Acquire(*req); });
}

::grpc::Status LockServer::Release(::grpc::ServerContext*, const ReleaseLockRequest* req, ReleaseLockResponse* resp) {
  return Guard([&] { *resp = service_->Release(*req); });
}

::grpc::Status LockServer::Override(::grpc::ServerContext*, const OverrideLockRequest* req, OverrideLockResponse* resp) {
  return Guard([&] { *resp = service_->Override(*req); });
}

::grpc::Status LockServer::GetLockStatus(::grpc::ServerContext*, const GetLockStatusRequest* req, GetLockStatusResponse* resp) {
  return Guard([&] { *resp = service_->GetLockStatus(*req); });
}

::grpc::Status LockServer::GetConflict(::grpc::ServerContext*, const GetConflictRequest* req, GetConflictResponse* resp) {
  return Guard([&] { *resp = service_->GetConflict(*req); });
}

::grpc::Status LockServer::ResolveConflict(::grpc::ServerContext*, const ResolveConflictRequest* req, ResolveConflictResponse* resp) {
  return Guard([&] { *resp = service_->ResolveConflict(*req); });
}

::grpc::Status LockServer::ListConflicts(::grpc::ServerContext*, const ListConflictsRequest* req, ListConflictsResponse* resp) {
  return Guard([&] { *resp = service_->ListConflicts(*req); });
}

} // namespace resync::grpc
