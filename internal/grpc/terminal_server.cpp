#include "terminal_server.hpp"

#include "grpc_error.hpp"

namespace resync::grpc {

using namespace resync::v1;

TerminalServer::TerminalServer(std::shared_ptr<resync::service::TerminalService> svc) : service_(std::move(svc)) {
}

::grpc::Status TerminalServer::FlushAndRelease(::grpc::ServerContext*, const FlushAndReleaseRequest* req, FlushAndReleaseResponse* resp) {
  return Guard([&] { *resp = service_->FlushAndRelease(*req); });
}

::grpc::Status TerminalServer::SaveCheck(::grpc::ServerContext*, const SaveCheckRequest* req, SaveCheckResponse* resp) {
  return Guard([&] { *resp = service_->SaveCheck(*req); });
}

::grpc::Status TerminalServer::RecordPayment(::grpc::ServerContext*, const RecordPaymentRequest* req, RecordPaymentResponse* resp) {
  return Guard([&] { *resp = service_->RecordPayment(*req); });
}

::grpc::Status TerminalServer::RecordTimeEntry(::grpc::ServerContext*, const RecordTimeEntryRequest* req, RecordTimeEntryResponse* resp) {
  return Guard([&] { *resp = service_->RecordTimeEntry(*req); });
}

} // namespace resync::grpc
