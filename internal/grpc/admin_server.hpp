#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "resync/v1/admin_service.grpc.pb.h"

namespace resync::grpc {

class AdminServer final : public resync::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<resync::service::AdminService> svc);

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const resync::v1::HeartbeatRequest*, resync::v1::HeartbeatResponse*) override;
  ::grpc::Status GetStatus(::grpc::ServerContext*, const resync::v1::GetStatusRequest*, resync::v1::GetStatusResponse*) override;

 private:
  std::shared_ptr<resync::service::AdminService> service_;
};

} // namespace resync::grpc
