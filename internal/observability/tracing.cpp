#include "internal/observability/spans.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace resync::observability {

OtlpConfig ResolveOtlpConfig(const resync::runtime::config::RuntimeConfig& config) {
  using resync::runtime::config::NodeRole;

  OtlpConfig otlp;
  otlp.node_id = config.node().node_id();
  switch (config.node().role()) {
    case NodeRole::NODE_ROLE_RELAY_HOST:
      otlp.role = "relay_host";
      break;
    case NodeRole::NODE_ROLE_CLOUD:
      otlp.role = "cloud";
      break;
    default:
      otlp.role = "terminal";
      break;
  }

  const auto& observability = config.observability();
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  otlp.endpoint = observability.otlp_endpoint();
  if (observability.transport() == resync::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp.transport = OtlpTransport::kHttpProtobuf;
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, std::string_view http_path) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  for (const char* name : {signal_env, "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name); endpoint != nullptr && *endpoint != '\0') {
      return endpoint;
    }
  }
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318" + std::string(http_path);
  }
  return "localhost:4317";
}

} // namespace resync::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

namespace resync::observability {
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_tracer_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& otlp) {
  namespace exporter = opentelemetry::exporter::otlp;

  const auto endpoint = ResolveOtlpEndpoint(otlp, "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "/v1/traces");
  if (otlp.transport == OtlpTransport::kHttpProtobuf) {
    exporter::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return exporter::OtlpHttpExporterFactory::Create(options);
  }
  exporter::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !otlp.insecure;
  return exporter::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const resync::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  const auto otlp     = ResolveOtlpConfig(config);
  auto       resource = opentelemetry::sdk::resource::Resource::Create({
      {"service.name", otlp.service_name},
      {"service.instance.id", otlp.node_id},
      {"resync.node.role", otlp.role},
  });

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(otlp), sdktrace::BatchSpanProcessorOptions{});
  g_tracer_provider =
      std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracer_provider));

  g_tracer = g_tracer_provider->GetTracer("resync", "0.1.0");
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (!g_tracer_provider) {
    return;
  }
  g_tracer_provider->ForceFlush();
  g_tracer_provider->Shutdown();
  g_tracer_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> started)
      : span(std::move(started)), scope(g_tracer->WithActiveSpan(span)) {}
};

SpanScope::SpanScope(std::string_view name) {
  if (g_tracer) {
    impl_ = std::make_unique<Impl>(g_tracer->StartSpan(std::string(name)));
  }
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace resync::observability

#else

namespace resync::observability {

struct SpanScope::Impl {};

bool InitializeTracing(const resync::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownTracing() {}

SpanScope::SpanScope(std::string_view) {}
SpanScope::~SpanScope()                               = default;
SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {}
void SpanScope::SetAttribute(std::string_view, std::int64_t) {}
void SpanScope::AddEvent(std::string_view) {}
void SpanScope::RecordException(std::string_view) {}

} // namespace resync::observability

#endif
