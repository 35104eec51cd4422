#include "internal/observability/logging.hpp"

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef REGISTRAR_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/span_context.h>
#endif

namespace registrar::observability {
namespace {

constexpr const char* kLoggerName     = "registrar";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context = false;

std::string FromEnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (const char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

bool IncludeTraceContext(const registrar::runtime::config::RuntimeConfig& config) {
  if (const char* value = std::getenv("REGISTRAR_LOG_INCLUDE_TRACE_CONTEXT"); value != nullptr && *value != '\0') {
    const std::string_view flag(value);
    return flag == "1" || flag == "true";
  }
  return config.logging().include_trace_context();
}

#ifdef REGISTRAR_ENABLE_OTEL
std::string Hex(const std::uint8_t* bytes, std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[bytes[i] >> 4]);
    out.push_back(kDigits[bytes[i] & 0x0F]);
  }
  return out;
}

std::string TraceContext() {
  if (!g_include_trace_context) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};
  const auto context = span->GetContext();
  if (!context.IsValid()) return {};
  std::uint8_t trace_id[opentelemetry::trace::TraceId::kSize];
  std::uint8_t span_id[opentelemetry::trace::SpanId::kSize];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  return "trace_id=" + Hex(trace_id, sizeof(trace_id)) + " span_id=" + Hex(span_id, sizeof(span_id));
}
#else
std::string TraceContext() {
  return {};
}
#endif

std::shared_ptr<spdlog::logger> BuildLogger(const std::string& file) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
  }
  return std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
}

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

LogField ScoreField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.2f}", value)};
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str maps unknown names to off; only "off" itself may produce it.
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level '" + std::string(name) + "'");
  }
  return level;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const registrar::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(FromEnvOr("REGISTRAR_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = FromEnvOr("REGISTRAR_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  auto logger = BuildLogger(config.logging().file());
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = IncludeTraceContext(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto       formatted = FormatFields(fields);
  const auto trace     = TraceContext();
  if (!trace.empty()) {
    formatted += formatted.empty() ? trace : " " + trace;
  }

  if (formatted.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, formatted);
}

} // namespace registrar::observability
