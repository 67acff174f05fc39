#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace mprisrelay::runtime::config {
class LoggingConfig;
}

namespace mprisrelay::observability {

/*
  Structured agent logging on top of spdlog.

  A record is a message followed by key=value fields. Values containing
  spaces, quotes or '=' are quoted, so player titles and client names
  supplied by remote peers cannot forge extra fields.

  Output goes to stderr; stdout is reserved for the console pairing
  prompt. MPRISRELAY_LOG_LEVEL and MPRISRELAY_LOG_PATTERN override the
  configuration.
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
void InitializeLogging(const mprisrelay::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// Exposed for tests.
std::string FormatFields(std::initializer_list<LogField> fields);

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace mprisrelay::observability

#define MPRISRELAY_LOG_DEBUG(message, ...) ::mprisrelay::observability::LogDebug((message), ##__VA_ARGS__)
#define MPRISRELAY_LOG_INFO(message, ...) ::mprisrelay::observability::LogInfo((message), ##__VA_ARGS__)
#define MPRISRELAY_LOG_WARN(message, ...) ::mprisrelay::observability::LogWarn((message), ##__VA_ARGS__)
#define MPRISRELAY_LOG_ERROR(message, ...) ::mprisrelay::observability::LogError((message), ##__VA_ARGS__)
