#include "server.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resync::runtime {

namespace {

constexpr int kKeepaliveTimeMs    = 10000;
constexpr int kKeepaliveTimeoutMs = 3000;
// In-flight RPCs get this long to finish on Stop().
constexpr auto kShutdownGrace = std::chrono::seconds(5);

} // namespace

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (server_) {
    return;
  }

  int                   bound_port = 0;
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &bound_port);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIME_MS, kKeepaliveTimeMs);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, kKeepaliveTimeoutMs);
  builder.AddChannelArgument(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  server_ = builder.BuildAndStart();
  if (!server_ || bound_port == 0) {
    server_.reset();
    throw util::Unavailable("cannot listen on " + bind_address_);
  }

  RESYNC_LOG_INFO("gRPC listening", {observability::StringField("address", bind_address_), observability::IntField("port", bound_port),
                                     observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Stop() {
  if (!server_) {
    return;
  }
  server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
  server_.reset();
}

} // namespace resync::runtime
