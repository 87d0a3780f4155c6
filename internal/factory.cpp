#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "client/cpp/resync_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/connectivity/connectivity_monitor.hpp"
#include "internal/connectivity/terminal_presence.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/lock_server.hpp"
#include "internal/grpc/sync_server.hpp"
#include "internal/grpc/terminal_server.hpp"
#include "internal/lock/check_lock_client.hpp"
#include "internal/lock/check_lock_manager.hpp"
#include "internal/lock/static_authorizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/replay/local_writer.hpp"
#include "internal/replay/replay_queue.hpp"
#include "internal/replay/repository_store.hpp"
#include "internal/replay/sync_worker.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/lock_service.hpp"
#include "internal/service/sync_service.hpp"
#include "internal/service/terminal_service.hpp"
#if RESYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if RESYNC_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace resync::factory {

using namespace resync;
using resync::runtime::config::NODE_ROLE_TERMINAL;
using resync::runtime::config::RuntimeConfig;

namespace {

std::chrono::milliseconds Ms(uint32_t value) {
  return std::chrono::milliseconds(value);
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RESYNC_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RESYNC_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    db::postgres::BootstrapSchema(*pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

// Configured properties are upserted on every start. A business date the
// fiscal scheduler already advanced survives unless the file pins one.
void SeedProperties(db::Repository& repository, const RuntimeConfig& config) {
  auto tx = repository.Begin();
  for (const auto& property_config : config.properties()) {
    auto property = config::PropertyFromConfig(property_config);
    if (property.current_business_date.empty()) {
      if (auto stored = repository.GetProperty(*tx, property.id)) {
        property.current_business_date = stored->current_business_date;
      }
    }
    db::ThrowIfDbError(repository.UpsertProperty(*tx, property), "seed property " + property.id);
  }
  tx->Commit();
}

std::vector<lock::Credential> ManagerCredentials(const RuntimeConfig& config) {
  std::vector<lock::Credential> managers;
  for (const auto& manager : config.locks().managers()) {
    managers.push_back(lock::Credential{manager.employee_id(), manager.pin()});
  }
  return managers;
}

std::shared_ptr<client::ResyncClient> ClientFor(const std::string& address) {
  if (address.empty()) return nullptr;
  return std::make_shared<client::ResyncClient>(client::ResyncClient::Connect(address));
}

std::shared_ptr<connectivity::ConnectivityMonitor> BuildMonitor(const RuntimeConfig& config, const std::shared_ptr<util::Clock>& clock,
                                                                const std::shared_ptr<client::ResyncClient>& cloud,
                                                                const std::shared_ptr<client::ResyncClient>& relay_host) {
  const auto& connectivity = config.connectivity();
  const auto& node         = config.node();

  connectivity::MonitorOptions options;
  options.missed_heartbeat_threshold = connectivity.missed_heartbeat_threshold();
  options.heartbeat_timeout          = Ms(connectivity.heartbeat_timeout_ms());

  auto monitor = std::make_shared<connectivity::ConnectivityMonitor>(clock, options);

  if (cloud) {
    monitor->AddAuthority(connectivity::kCloudAuthority, connectivity::AuthorityKind::kCloud,
                          std::make_shared<client::RemoteHeartbeat>(cloud, node.node_id(), node.advertise_address()),
                          Ms(connectivity.cloud_heartbeat_interval_ms()));
  }
  if (relay_host) {
    monitor->AddAuthority(connectivity::kRelayHostAuthority, connectivity::AuthorityKind::kRelayHost,
                          std::make_shared<client::RemoteHeartbeat>(relay_host, node.node_id(), node.advertise_address()),
                          Ms(connectivity.relay_heartbeat_interval_ms()));
  }
  for (const auto& peripheral : connectivity.peripherals()) {
    monitor->AddAuthority(peripheral.name(), connectivity::AuthorityKind::kPeripheral,
                          std::make_shared<client::ChannelHeartbeat>(client::ResyncClient::Connect(peripheral.address())),
                          Ms(peripheral.heartbeat_interval_ms()));
  }

  return monitor;
}

recovery::RecoveryOptions RecoveryOptionsFrom(const RuntimeConfig& config) {
  const auto& recovery = config.recovery();

  recovery::RecoveryOptions options;
  options.max_recovery_attempts                  = recovery.max_recovery_attempts();
  options.recovery_backoff                       = Ms(recovery.recovery_backoff_ms());
  options.health_check_interval                  = Ms(recovery.health_check_interval_ms());
  options.auto_recovery                          = recovery.auto_recovery_enabled();
  options.circuit_breaker.failure_threshold      = recovery.circuit_breaker().failure_threshold();
  options.circuit_breaker.recovery_time          = Ms(recovery.circuit_breaker().recovery_time_ms());
  options.circuit_breaker.half_open_max_attempts = recovery.circuit_breaker().half_open_max_attempts();
  return options;
}

// Wraps a background loop as a supervised service.
void Supervise(Application& app, std::string name, std::chrono::milliseconds interval, util::PeriodicTask::Body body) {
  auto task = std::make_shared<util::PeriodicTask>(name, interval, std::move(body));
  app.background_tasks.push_back(task);

  recovery::SupervisedService service;
  service.name         = std::move(name);
  service.start        = [task] { task->Start(); };
  service.stop         = [task] { task->Stop(); };
  service.health_check = [task] { return task->IsRunning(); };
  app.recovery->RegisterService(std::move(service));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;
  const auto& node = config.node();

  // ------------------------------------------------------------------
  // Persistence and shared components
  // ------------------------------------------------------------------
  auto clock      = std::make_shared<util::WallClock>();
  auto repository = BuildRepository(config);
  SeedProperties(*repository, config);

  auto authorizer = std::make_shared<lock::StaticAuthorizer>(ManagerCredentials(config));

  lock::LockManagerOptions lock_options;
  lock_options.flush_timeout = Ms(config.locks().flush_timeout_ms());

  auto& ctx      = app.ctx;
  ctx.node_id    = node.node_id();
  ctx.role       = node.role();
  ctx.clock      = clock;
  ctx.repository = repository;

  // ------------------------------------------------------------------
  // Role specific wiring
  // ------------------------------------------------------------------
  if (node.role() == NODE_ROLE_TERMINAL) {
    auto cloud      = ClientFor(node.cloud_address());
    auto relay_host = ClientFor(node.relay_host_address());
    ctx.monitor     = BuildMonitor(config, clock, cloud, relay_host);

    // Local-only manager: no presence tracking and no flush channel.
    ctx.lock_manager = std::make_shared<lock::CheckLockManager>(repository, clock, authorizer, nullptr, nullptr, lock_options);
    ctx.locks        = std::make_shared<lock::CheckLockClient>(ctx.monitor,
                                                        cloud ? std::make_shared<client::RemoteLockAuthority>(cloud) : nullptr,
                                                        relay_host ? std::make_shared<client::RemoteLockAuthority>(relay_host) : nullptr,
                                                        ctx.lock_manager);

    ctx.replay_queue = std::make_shared<replay::ReplayQueue>(repository, clock);
    ctx.replay_queue->ResetInFlight();

    replay::SyncWorkerOptions sync_options;
    sync_options.batch_size       = config.replay().batch_size();
    sync_options.dispatch_timeout = Ms(config.replay().dispatch_timeout_ms());
    ctx.sync_worker = std::make_shared<replay::SyncWorker>(ctx.replay_queue, ctx.monitor,
                                                           cloud ? std::make_shared<client::RemoteStore>(cloud, node.node_id()) : nullptr,
                                                           relay_host ? std::make_shared<client::RemoteStore>(relay_host, node.node_id()) : nullptr,
                                                           sync_options);
    ctx.writer = std::make_shared<replay::LocalWriter>(repository, ctx.replay_queue, clock);
  } else {
    // Relay host and cloud: authoritative store and lock authority.
    auto cloud  = node.role() == resync::runtime::config::NODE_ROLE_RELAY_HOST ? ClientFor(node.cloud_address()) : nullptr;
    ctx.monitor = BuildMonitor(config, clock, cloud, nullptr);

    ctx.presence = std::make_shared<connectivity::TerminalPresence>(Ms(config.locks().presence_heartbeat_interval_ms()),
                                                                    config.locks().presence_missed_threshold());
    ctx.lock_manager = std::make_shared<lock::CheckLockManager>(repository, clock, authorizer, ctx.presence,
                                                                std::make_shared<client::TerminalChannel>(ctx.presence, node.node_id()),
                                                                lock_options);
    ctx.locks = ctx.lock_manager;
    ctx.store = std::make_shared<replay::RepositoryStore>(repository, clock);
  }

  // ------------------------------------------------------------------
  // Supervised background loops
  // ------------------------------------------------------------------
  app.recovery = std::make_shared<recovery::RecoveryManager>(clock, RecoveryOptionsFrom(config));
  ctx.recovery = app.recovery;
  app.recovery->SetEventHandler([](const recovery::ServiceEvent& event) {
    if (event.event == recovery::RecoveryEvent::kRecoveryExhausted) {
      RESYNC_LOG_ERROR("Service recovery exhausted", {observability::StringField("service", event.service),
                                                      observability::StringField("detail", event.detail)});
    }
  });

  auto monitor = ctx.monitor;
  Supervise(app, "connectivity", Ms(config.connectivity().tick_interval_ms()), [monitor] { monitor->Tick(); });

  if (config.fiscal().enabled()) {
    fiscal::FiscalSchedulerOptions fiscal_options;
    fiscal_options.max_iterations = config.fiscal().max_iterations();
    app.fiscal_scheduler = std::make_shared<fiscal::FiscalScheduler>(repository, clock, fiscal_options);

    auto scheduler = app.fiscal_scheduler;
    Supervise(app, "fiscal", Ms(config.fiscal().tick_interval_ms()), [scheduler] { scheduler->RunOnce(); });
  }

  if (ctx.sync_worker) {
    auto worker = ctx.sync_worker;
    Supervise(app, "replay", Ms(config.replay().tick_interval_ms()), [worker] { worker->RunOnce(); });
  }

  // ------------------------------------------------------------------
  // Integration adapters, registered by deployment-specific code
  // ------------------------------------------------------------------
  app.payment_gateways = std::make_shared<integration::PaymentGatewayRegistry>();
  app.order_parsers    = std::make_shared<integration::OrderParserRegistry>();

  // ------------------------------------------------------------------
  // Services and gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::LockServer>(std::make_shared<service::LockService>(ctx)));

  if (node.role() == NODE_ROLE_TERMINAL) {
    app.grpc_services.push_back(std::make_unique<grpc::TerminalServer>(std::make_shared<service::TerminalService>(ctx)));
  } else {
    app.grpc_services.push_back(std::make_unique<grpc::SyncServer>(std::make_shared<service::SyncService>(ctx)));
  }

  RESYNC_LOG_INFO("Node assembled", {observability::StringField("node_id", node.node_id()),
                                     observability::IntField("properties", config.properties_size()),
                                     observability::IntField("services", static_cast<int64_t>(app.grpc_services.size()))});
  return app;
}

} // namespace resync::factory
