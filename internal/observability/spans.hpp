#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace resync::runtime::config {
class RuntimeConfig;
}

namespace resync::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Export settings shared by traces and metrics. node_id and role become
// resource attributes so a relay host can tell its terminals apart.
struct OtlpConfig {
  std::string   service_name{"resync"};
  std::string   node_id;
  std::string   role{"terminal"};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ResolveOtlpConfig(const resync::runtime::config::RuntimeConfig& config);

// Endpoint resolution order: config, the signal-specific OTEL env var,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, std::string_view http_path);

// Both return false when the signal is disabled or built without ENABLE_OTEL.
bool InitializeTracing(const resync::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const resync::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the current scope. A no-op when tracing is off.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

class Metrics {
 public:
  static Metrics& Instance();

  // RPC surface
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Offline resilience
  void SetReplayBacklog(std::uint64_t items);
  void RecordReplayDispatch(std::string_view entity_type, bool success);
  void RecordModeTransition(std::string_view mode);
  void RecordLockAcquire(std::string_view outcome);
  void RecordLockOverride(std::string_view outcome);
  void RecordRecoveryEvent(std::string_view service, std::string_view event);
  void RecordFiscalClose(std::string_view property_id);

 private:
  Metrics();
  ~Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace resync::observability
