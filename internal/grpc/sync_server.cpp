#include "sync_server.hpp"

#include "grpc_error.hpp"

namespace resync::grpc {

SyncServer::SyncServer(std::shared_ptr<resync::service::SyncService> svc) : service_(std::move(svc)) {
}

::grpc::Status SyncServer::Apply(::grpc::ServerContext*, const resync::v1::ApplyRequest* req, resync::v1::ApplyResponse* resp) {
  return Guard([&] { *resp = service_->Apply(*req); });
}

} // namespace resync::grpc
