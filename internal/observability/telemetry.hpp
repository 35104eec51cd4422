#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace registrar::runtime::config {
class RuntimeConfig;
}

namespace registrar::observability {

/*
  OpenTelemetry export for the registrar.

  Without REGISTRAR_ENABLE_OTEL every call below is an inline no-op, so
  services instrument unconditionally.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpSettings {
  std::string   service_name{"registrar"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
};

OtlpSettings OtlpSettingsFrom(const registrar::runtime::config::RuntimeConfig& config);

// Return false when the config leaves the signal disabled.
bool InitializeTracing(const registrar::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const registrar::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per service call, active for the lifetime of the object.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordError(std::string_view description);

 private:
#ifdef REGISTRAR_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// outcome is "ok", "rejected" (caller error) or "failed" (server fault).
class Metrics {
 public:
  static Metrics& Instance();

  void RecordCall(std::string_view route, std::string_view outcome, double latency_ms);
  void RecordGradePosted(char letter);
  void RecordAttendanceMarks(std::uint64_t inserted, std::uint64_t updated);

 private:
  Metrics();
#ifdef REGISTRAR_ENABLE_OTEL
  ~Metrics();
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef REGISTRAR_ENABLE_OTEL
inline bool InitializeTracing(const registrar::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const registrar::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordError(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordCall(std::string_view, std::string_view, double) {
}

inline void Metrics::RecordGradePosted(char) {
}

inline void Metrics::RecordAttendanceMarks(std::uint64_t, std::uint64_t) {
}
#endif

} // namespace registrar::observability
