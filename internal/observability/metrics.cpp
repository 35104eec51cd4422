#include "internal/observability/telemetry.hpp"

#ifdef REGISTRAR_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define REGISTRAR_OTEL_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define REGISTRAR_OTEL_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <utility>

#include "config/config.pb.h"

namespace registrar::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

constexpr std::uint32_t kDefaultExportIntervalMs = 10000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string MetricsEndpoint(const OtlpSettings& settings) {
  if (!settings.endpoint.empty()) return settings.endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;
  return settings.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricsEndpoint(settings);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricsEndpoint(settings);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// AddMetricReader takes a unique_ptr in newer SDKs and a shared_ptr in older ones.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

bool InitializeMetrics(const registrar::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = OtlpSettingsFrom(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs);
#ifdef REGISTRAR_OTEL_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(settings), reader_options);
#endif

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           resource::Resource::Create({{"service.name", settings.service_name}}));
  AttachReader(*g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> calls;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      call_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> grades_posted;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> attendance_marks;
};

// Instruments bind to whichever provider is global at first use, so
// InitializeMetrics must run before the first service call.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("registrar");

  impl_->calls            = impl_->meter->CreateUInt64Counter("registrar.rpc.calls", "Service calls by route and outcome", "1");
  impl_->call_latency_ms  = impl_->meter->CreateDoubleHistogram("registrar.rpc.latency_ms", "Service call latency", "ms");
  impl_->grades_posted    = impl_->meter->CreateUInt64Counter("registrar.grades.posted", "Grades recorded by letter", "1");
  impl_->attendance_marks = impl_->meter->CreateUInt64Counter("registrar.attendance.marks", "Attendance rows written by outcome", "1");
}

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordCall(std::string_view route, std::string_view outcome, double latency_ms) {
  const std::string route_label(route);
  const std::string outcome_label(outcome);
  Add(impl_->calls, static_cast<std::uint64_t>(1), {{"route", route_label}, {"outcome", outcome_label}});
  Record(impl_->call_latency_ms, latency_ms, {{"route", route_label}});
}

void Metrics::RecordGradePosted(char letter) {
  const std::string letter_label(1, letter);
  Add(impl_->grades_posted, static_cast<std::uint64_t>(1), {{"letter", letter_label}});
}

void Metrics::RecordAttendanceMarks(std::uint64_t inserted, std::uint64_t updated) {
  if (inserted > 0) Add(impl_->attendance_marks, inserted, {{"outcome", "inserted"}});
  if (updated > 0) Add(impl_->attendance_marks, updated, {{"outcome", "updated"}});
}

} // namespace registrar::observability

#endif
