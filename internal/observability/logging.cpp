#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace resync::observability {
namespace {

using resync::runtime::config::LoggingConfig;
using resync::runtime::config::RuntimeConfig;

constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Fields stamped on every line so relay and terminal logs can be merged
// after the fact.
std::string g_node_fields;
bool        g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? std::string(value) : fallback;
}

bool EnvFlag(const char* name, bool fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return fallback;
  }
  const std::string flag(value);
  return flag == "1" || flag == "true";
}

std::string RoleName(resync::runtime::config::NodeRole role) {
  switch (role) {
    case resync::runtime::config::NODE_ROLE_RELAY_HOST:
      return "relay_host";
    case resync::runtime::config::NODE_ROLE_CLOUD:
      return "cloud";
    default:
      return "terminal";
  }
}

// Values with whitespace or '=' are quoted so key=value pairs stay parseable.
void AppendValue(std::string& out, const std::string& value) {
  if (value.find_first_of(" =\t\"") == std::string::npos && !value.empty()) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
}

void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) {
    out += ' ';
  }
  out += field.key;
  out += '=';
  AppendValue(out, field.value);
}

std::vector<spdlog::sink_ptr> BuildSinks(const LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file_path = EnvOr("RESYNC_LOG_FILE", logging.file_path());
  if (!file_path.empty()) {
    const std::size_t max_bytes = static_cast<std::size_t>(logging.max_file_size_mb()) * 1024 * 1024;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, max_bytes, logging.max_files()));
  }
  return sinks;
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out += kHex[(data[i] >> 4) & 0x0F];
    out += kHex[data[i] & 0x0F];
  }
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  span->GetContext().trace_id().CopyBytesTo(trace_bytes);
  span->GetContext().span_id().CopyBytesTo(span_bytes);
  out += out.empty() ? "trace_id=" : " trace_id=";
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  out += " span_id=";
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const RuntimeConfig& config) {
  const auto& logging = config.logging();
  const auto  name    = "resync-" + config.node().node_id();

  spdlog::drop(name);
  auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{});
  for (auto& sink : BuildSinks(logging)) {
    logger->sinks().push_back(std::move(sink));
  }
  logger->set_pattern(EnvOr("RESYNC_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern()));
  logger->set_level(spdlog::level::from_str(EnvOr("RESYNC_LOG_LEVEL", logging.level().empty() ? "info" : logging.level())));
  // A terminal can lose power at any moment; warnings and above hit disk now.
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_node_fields.clear();
  AppendField(g_node_fields, StringField("node", config.node().node_id()));
  AppendField(g_node_fields, StringField("role", RoleName(config.node().role())));
  g_include_trace_context = EnvFlag("RESYNC_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context());
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string suffix;
  for (const auto& field : fields) {
    AppendField(suffix, field);
  }
  if (!g_node_fields.empty()) {
    suffix += suffix.empty() ? g_node_fields : " " + g_node_fields;
  }
  AppendTraceContext(suffix);

  if (suffix.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, suffix);
  }
}

} // namespace resync::observability
