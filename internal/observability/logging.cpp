#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace graphflow::observability {
namespace {

constexpr const char* kLoggerName     = "graphflow";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment first, then config, then fallback.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value && *value) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '=') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out += c;
    }
  }
  out += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  span->GetContext().trace_id().CopyBytesTo(trace_bytes);
  span->GetContext().span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.3f", value);
  return {std::string(key), buffer};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out += ' ';
    }
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  if (name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  // from_str maps every unknown name to off.
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off) {
    throw util::InvalidArgument("unknown log level '" + std::string(name) + "'");
  }
  return level;
}

void InitializeLogging(const graphflow::runtime::config::RuntimeConfig& config) {
  const auto level = ParseLevel(Setting("GRAPHFLOW_LOG_LEVEL", config.logging().level(), "info"));

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Setting("GRAPHFLOW_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const char* include_trace = std::getenv("GRAPHFLOW_LOG_INCLUDE_TRACE_CONTEXT");
  g_include_trace_context   = include_trace ? (std::string(include_trace) == "1" || std::string(include_trace) == "true")
                                            : config.logging().include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& suffix : {FormatFields(fields), TraceContextFields()}) {
    if (!suffix.empty()) {
      line += ' ';
      line += suffix;
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace graphflow::observability
