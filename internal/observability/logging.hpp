#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace graphflow::runtime::config {
class RuntimeConfig;
}

namespace graphflow::observability {

/*
  Structured logging on top of spdlog.

  A log line is the message followed by key=value pairs. Values that
  contain whitespace, quotes or '=' (node errors, file paths) are quoted
  so a line stays machine splittable.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);

// "key=value key2=\"two words\""
std::string FormatFields(std::initializer_list<LogField> fields);

// spdlog level names plus "warning"; throws util::InvalidArgument otherwise.
spdlog::level::level_enum ParseLevel(std::string_view name);

// Level and pattern come from GRAPHFLOW_LOG_LEVEL / GRAPHFLOW_LOG_PATTERN,
// then the logging config section, then defaults.
void InitializeLogging(const graphflow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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

} // namespace graphflow::observability

#define GRAPHFLOW_LOG_DEBUG(message, ...) ::graphflow::observability::LogDebug((message), ##__VA_ARGS__)
#define GRAPHFLOW_LOG_INFO(message, ...) ::graphflow::observability::LogInfo((message), ##__VA_ARGS__)
#define GRAPHFLOW_LOG_WARN(message, ...) ::graphflow::observability::LogWarn((message), ##__VA_ARGS__)
#define GRAPHFLOW_LOG_ERROR(message, ...) ::graphflow::observability::LogError((message), ##__VA_ARGS__)
