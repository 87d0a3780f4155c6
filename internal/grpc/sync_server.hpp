#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/sync_service.hpp"
#include "resync/v1/sync_service.grpc.pb.h"

namespace resync::grpc {

class SyncServer final : public resync::v1::SyncService::Service {
 public:
  explicit SyncServer(std::shared_ptr<resync::service::SyncService> svc);

  ::grpc::Status Apply(::grpc::ServerContext*, const resync::v1::ApplyRequest*, resync::v1::ApplyResponse*) override;

 private:
  std::shared_ptr<resync::service::SyncService> service_;
};

} // namespace resync::grpc
