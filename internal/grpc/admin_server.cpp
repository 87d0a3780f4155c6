#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace resync::grpc {

AdminServer::AdminServer(std::shared_ptr<resync::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Heartbeat(::grpc::ServerContext*, const resync::v1::HeartbeatRequest* req, resync::v1::HeartbeatResponse* resp) {
  return Guard([&] { *resp = service_->Heartbeat(*req); });
}

::grpc::Status AdminServer::GetStatus(::grpc::ServerContext*, const resync::v1::GetStatusRequest* req, resync::v1::GetStatusResponse* resp) {
  return Guard([&] { *resp = service_->GetStatus(*req); });
}

} // namespace resync::grpc
