#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace registrar::runtime::config {
class RuntimeConfig;
}

namespace registrar::observability {

// One key=value pair appended to a log line. Values holding spaces,
// quotes or '=' are quoted when the line is written.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField ScoreField(std::string_view key, double value);

// Throws std::invalid_argument for a level name spdlog does not know.
spdlog::level::level_enum ParseLevel(std::string_view name);

std::string FormatFields(std::initializer_list<LogField> fields);

/*
  Installs the "registrar" logger as the spdlog default.

  REGISTRAR_LOG_LEVEL, REGISTRAR_LOG_PATTERN and
  REGISTRAR_LOG_INCLUDE_TRACE_CONTEXT override the logging section of the
  config. When logging.file is set the logger writes to that file as well
  as stdout.
*/
void InitializeLogging(const registrar::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace registrar::observability

#define REGISTRAR_LOG_INFO(message, ...) ::registrar::observability::LogInfo((message), ##__VA_ARGS__)
#define REGISTRAR_LOG_WARN(message, ...) ::registrar::observability::LogWarn((message), ##__VA_ARGS__)
#define REGISTRAR_LOG_ERROR(message, ...) ::registrar::observability::LogError((message), ##__VA_ARGS__)
