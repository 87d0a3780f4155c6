#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/terminal_service.hpp"
#include "resync/v1/terminal_service.grpc.pb.h"

namespace resync::grpc {

class TerminalServer final : public resync::v1::TerminalService::Service {
 public:
  explicit TerminalServer(std::shared_ptr<resync::service::TerminalService> svc);

  ::grpc::Status FlushAndRelease(::grpc::ServerContext*, const resync::v1::FlushAndReleaseRequest*,
                                 resync::v1::FlushAndReleaseResponse*) override;
  ::grpc::Status SaveCheck(::grpc::ServerContext*, const resync::v1::SaveCheckRequest*, resync::v1::SaveCheckResponse*) override;
  ::grpc::Status RecordPayment(::grpc::ServerContext*, const resync::v1::RecordPaymentRequest*, resync::v1::RecordPaymentResponse*) override;
  ::grpc::Status RecordTimeEntry(::grpc::ServerContext*, const resync::v1::RecordTimeEntryRequest*,
                                 resync::v1::RecordTimeEntryResponse*) override;

 private:
  std::shared_ptr<resync::service::TerminalService> service_;
};

} // namespace resync::grpc
