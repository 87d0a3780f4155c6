#pragma once

#include "resync/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace resync::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  // Terminal presence heartbeat; the reply doubles as a liveness answer.
  resync::v1::HeartbeatResponse Heartbeat(const resync::v1::HeartbeatRequest& req);

  resync::v1::GetStatusResponse GetStatus(const resync::v1::GetStatusRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace resync::service
