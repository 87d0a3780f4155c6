#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace resync::runtime::config {
class RuntimeConfig;
}

namespace resync::observability {

/*
  Structured logging on top of spdlog.

  A line is "<message> key=value ... node=<id> role=<role>" with the
  current trace and span ids appended when enabled. Console output is
  always on; logging.file_path adds a rotating file so a terminal keeps
  its history through an outage.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

// Safe to call again; the previous logger is replaced.
void InitializeLogging(const resync::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace resync::observability

#define RESYNC_LOG_DEBUG(message, ...) ::resync::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define RESYNC_LOG_INFO(message, ...) ::resync::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define RESYNC_LOG_WARN(message, ...) ::resync::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define RESYNC_LOG_ERROR(message, ...) ::resync::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
