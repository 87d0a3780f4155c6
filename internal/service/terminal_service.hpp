#pragma once

#include "resync/v1/terminal_service.pb.h"
#include "service_context.hpp"

namespace resync::service {

/*
  Terminal-local operations: the write path into the replay queue and the
  flush-and-release handshake an authority calls during a lock override.
*/
class TerminalService {
 public:
  explicit TerminalService(ServiceContext ctx);

  resync::v1::FlushAndReleaseResponse FlushAndRelease(const resync::v1::FlushAndReleaseRequest& req);

  resync::v1::SaveCheckResponse       SaveCheck(const resync::v1::SaveCheckRequest& req);
  resync::v1::RecordPaymentResponse   RecordPayment(const resync::v1::RecordPaymentRequest& req);
  resync::v1::RecordTimeEntryResponse RecordTimeEntry(const resync::v1::RecordTimeEntryRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace resync::service
