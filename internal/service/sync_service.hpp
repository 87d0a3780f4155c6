#pragma once

#include "resync/v1/sync_service.pb.h"
#include "service_context.hpp"

namespace resync::service {

class SyncService {
 public:
  explicit SyncService(ServiceContext ctx);

  resync::v1::ApplyResponse Apply(const resync::v1::ApplyRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace resync::service
