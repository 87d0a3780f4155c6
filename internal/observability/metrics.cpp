#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <utility>

#include "config/config.pb.h"

namespace resync::observability {
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attribute = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Counter   = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;

opentelemetry::nostd::string_view Sv(std::string_view value) {
  return {value.data(), value.size()};
}

constexpr std::uint32_t kDefaultCollectionIntervalMs = 10000;

std::shared_ptr<sdkmetrics::MeterProvider> g_meter_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& otlp) {
  namespace exporter = opentelemetry::exporter::otlp;

  const auto endpoint = ResolveOtlpEndpoint(otlp, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");
  if (otlp.transport == OtlpTransport::kHttpProtobuf) {
    exporter::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return exporter::OtlpHttpMetricExporterFactory::Create(options);
  }
  exporter::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !otlp.insecure;
  return exporter::OtlpGrpcMetricExporterFactory::Create(options);
}

// The SDK dropped the context-less overloads in newer releases.
template <typename Instrument, typename Value>
void Emit(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, std::initializer_list<Attribute> attributes) {
  if (!instrument) {
    return;
  }
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument->Add(value, attributes); }) {
    instrument->Add(value, attributes);
  } else if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

void Increment(const Counter& counter, std::initializer_list<Attribute> attributes) {
  Emit(counter, static_cast<std::uint64_t>(1), attributes);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter                                                          requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>> request_latency_ms;
  Counter                                                          replay_dispatches;
  Counter                                                          mode_transitions;
  Counter                                                          lock_acquires;
  Counter                                                          lock_overrides;
  Counter                                                          recovery_events;
  Counter                                                          fiscal_closes;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> replay_backlog_gauge;

  // Last value published by the sync worker, read by the gauge callback.
  std::atomic<std::int64_t> replay_backlog{0};

  static void ObserveBacklog(metrics_api::ObserverResult result, void* state) {
    using Observer = opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>;
    if (opentelemetry::nostd::holds_alternative<Observer>(result)) {
      opentelemetry::nostd::get<Observer>(result)->Observe(static_cast<Impl*>(state)->replay_backlog.load());
    }
  }
};

bool InitializeMetrics(const resync::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  const auto otlp = ResolveOtlpConfig(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : kDefaultCollectionIntervalMs);

  auto resource = opentelemetry::sdk::resource::Resource::Create({
      {"service.name", otlp.service_name},
      {"service.instance.id", otlp.node_id},
      {"resync.node.role", otlp.role},
  });
  g_meter_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource);
  g_meter_provider->AddMetricReader(
      sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_meter_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_meter_provider) {
    return;
  }
  g_meter_provider->ForceFlush();
  g_meter_provider->Shutdown();
  g_meter_provider.reset();
}

// Instruments bind to whichever provider is global on first use, so
// InitializeMetrics must run before anything records.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto& m   = *impl_;
  m.meter   = metrics_api::Provider::GetMeterProvider()->GetMeter("resync", "0.1.0");
  auto& mtr = m.meter;

  m.requests           = mtr->CreateUInt64Counter("resync.rpc.requests", "RPCs handled", "1");
  m.request_latency_ms = mtr->CreateDoubleHistogram("resync.rpc.latency", "RPC handling time", "ms");
  m.replay_dispatches  = mtr->CreateUInt64Counter("resync.replay.dispatches", "Replay items sent upstream", "1");
  m.mode_transitions   = mtr->CreateUInt64Counter("resync.connectivity.transitions", "Connection mode changes", "1");
  m.lock_acquires      = mtr->CreateUInt64Counter("resync.lock.acquires", "Check lock acquire attempts by outcome", "1");
  m.lock_overrides     = mtr->CreateUInt64Counter("resync.lock.overrides", "Manager lock overrides by outcome", "1");
  m.recovery_events    = mtr->CreateUInt64Counter("resync.recovery.events", "Service supervision events", "1");
  m.fiscal_closes      = mtr->CreateUInt64Counter("resync.fiscal.closes", "Business days closed", "1");

  m.replay_backlog_gauge = mtr->CreateInt64ObservableGauge("resync.replay.backlog", "Replay items not yet synced", "1");
  m.replay_backlog_gauge->AddCallback(&Impl::ObserveBacklog, impl_.get());
}

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Increment(impl_->requests, {{"rpc.route", Sv(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Emit(impl_->request_latency_ms, latency_ms, {{"rpc.route", Sv(route)}});
}

void Metrics::SetReplayBacklog(std::uint64_t items) {
  impl_->replay_backlog.store(static_cast<std::int64_t>(items));
}

void Metrics::RecordReplayDispatch(std::string_view entity_type, bool success) {
  Increment(impl_->replay_dispatches, {{"entity_type", Sv(entity_type)}, {"success", success}});
}

void Metrics::RecordModeTransition(std::string_view mode) {
  Increment(impl_->mode_transitions, {{"mode", Sv(mode)}});
}

void Metrics::RecordLockAcquire(std::string_view outcome) {
  Increment(impl_->lock_acquires, {{"outcome", Sv(outcome)}});
}

void Metrics::RecordLockOverride(std::string_view outcome) {
  Increment(impl_->lock_overrides, {{"outcome", Sv(outcome)}});
}

void Metrics::RecordRecoveryEvent(std::string_view service, std::string_view event) {
  Increment(impl_->recovery_events, {{"service", Sv(service)}, {"event", Sv(event)}});
}

void Metrics::RecordFiscalClose(std::string_view property_id) {
  Increment(impl_->fiscal_closes, {{"property_id", Sv(property_id)}});
}

} // namespace resync::observability

#else

namespace resync::observability {

struct Metrics::Impl {};

bool InitializeMetrics(const resync::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownMetrics() {}

Metrics::Metrics()  = default;
Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, bool) {}
void Metrics::ObserveRequestLatencyMs(std::string_view, double) {}
void Metrics::SetReplayBacklog(std::uint64_t) {}
void Metrics::RecordReplayDispatch(std::string_view, bool) {}
void Metrics::RecordModeTransition(std::string_view) {}
void Metrics::RecordLockAcquire(std::string_view) {}
void Metrics::RecordLockOverride(std::string_view) {}
void Metrics::RecordRecoveryEvent(std::string_view, std::string_view) {}
void Metrics::RecordFiscalClose(std::string_view) {}

} // namespace resync::observability

#endif
