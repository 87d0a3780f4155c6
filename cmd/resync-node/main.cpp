#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

const char* RoleName(resync::runtime::config::NodeRole role) {
  switch (role) {
    case resync::runtime::config::NODE_ROLE_RELAY_HOST:
      return "relay_host";
    case resync::runtime::config::NODE_ROLE_CLOUD:
      return "cloud";
    default:
      return "terminal";
  }
}

// Flushes exporters last so shutdown logging still goes out.
void StopObservability() {
  resync::observability::ShutdownMetrics();
  resync::observability::ShutdownTracing();
  resync::observability::ShutdownLogging();
}

int Usage() {
  std::cerr << "usage: resync-node [--config] <config.yaml>\n"
               "  RESYNC_LOG_LEVEL, RESYNC_LOG_FILE and RESYNC_LOG_PATTERN override the logging section\n";
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2 && std::string(argv[1]) != "--config") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    return Usage();
  }

  resync::runtime::config::RuntimeConfig config;
  try {
    config = resync::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    // Logging is not configured yet.
    std::cerr << "resync-node: " << e.what() << '\n';
    return 1;
  }

  try {
    resync::observability::InitializeLogging(config);
    resync::observability::InitializeTracing(config);
    resync::observability::InitializeMetrics(config);

    // Builds the role's components and requeues replay items left
    // in flight by an unclean stop.
    auto app = resync::factory::Build(config);

    resync::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    // The RPC surface comes up before the loops so peers probing this node
    // see it reachable as soon as its heartbeats start.
    server.Start();
    app.recovery->StartAll();
    app.recovery->StartHealthChecks();

    RESYNC_LOG_INFO("Node up", {resync::observability::StringField("role", RoleName(config.node().role())),
                                resync::observability::StringField("bind_address", config.server().bind_address()),
                                resync::observability::IntField("properties", config.properties_size())});

    while (g_stop_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    RESYNC_LOG_INFO("Node stopping");
    app.recovery->StopHealthChecks();
    app.recovery->StopAll();
    server.Stop();
    StopObservability();
  } catch (const std::exception& e) {
    RESYNC_LOG_ERROR("Node failed", {resync::observability::StringField("error", e.what())});
    StopObservability();
    return 2;
  }

  return 0;
}
