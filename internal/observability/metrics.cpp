#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define RAGCTX_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace ragctx::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Instrument groups switched by observability.metrics.*; all on until InitializeMetrics runs.
std::atomic<bool> g_request_metrics{true};
std::atomic<bool> g_candidate_metrics{true};
std::atomic<bool> g_graph_metrics{true};
std::atomic<bool> g_route_labels{true};

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// Older SDKs take the context argument, newer ones overload without it.
template <typename Instrument, typename Value>
void Emit(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument->Record(value, attributes); }) {
    instrument->Record(value, attributes);
  } else {
    instrument->Add(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> candidates;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> context_chars;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>     graph_vertices;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>     graph_edges;

  std::atomic<std::int64_t> vertices{0};
  std::atomic<std::int64_t> edges{0};
};

namespace {

void ObserveAtomic(metrics_api::ObserverResult result, void* state) {
  const auto* value = static_cast<const std::atomic<std::int64_t>*>(state);
  auto observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
  observer->Observe(value->load(std::memory_order_relaxed));
}

} // namespace

bool InitializeMetrics(const ragctx::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metrics = observability.metrics();
  g_request_metrics   = metrics.request_metrics_enabled();
  g_candidate_metrics = metrics.candidate_metrics_enabled();
  g_graph_metrics     = metrics.graph_metrics_enabled();
  g_route_labels      = metrics.route_labels_enabled();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : 1000);
  if (metrics.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metrics.export_timeout_ms());
  }

  auto exporter = BuildExporter(ResolveOtlpSettings(observability, OtlpSignal::kMetrics));
#ifdef RAGCTX_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  const auto service = resource::Resource::Create(
      {{"service.name", std::string(kServiceName)}, {"service.version", std::string(kServiceVersion)}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), service);
  g_provider->AddMetricReader(std::move(reader));

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

// Instruments bind to whichever provider is global at first use, so
// InitializeMetrics must run before the first request.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(std::string(kServiceName), std::string(kServiceVersion));

  impl_->requests      = impl_->meter->CreateUInt64Counter("ragctx.request.count", "Service calls by route and outcome", "1");
  impl_->latency_ms    = impl_->meter->CreateDoubleHistogram("ragctx.request.latency_ms", "Service call latency", "ms");
  impl_->candidates    = impl_->meter->CreateUInt64Histogram("ragctx.context.candidates", "Documents contributed by one bucket", "1");
  impl_->context_chars = impl_->meter->CreateUInt64Histogram("ragctx.context.chars", "Characters in one assembled context", "1");

  impl_->graph_vertices = impl_->meter->CreateInt64ObservableGauge("ragctx.graph.vertices", "Link graph vertices", "1");
  impl_->graph_edges    = impl_->meter->CreateInt64ObservableGauge("ragctx.graph.edges", "Link graph edges", "1");
  impl_->graph_vertices->AddCallback(ObserveAtomic, &impl_->vertices);
  impl_->graph_edges->AddCallback(ObserveAtomic, &impl_->edges);
}

Metrics::~Metrics() {
  impl_->graph_vertices->RemoveCallback(ObserveAtomic, &impl_->vertices);
  impl_->graph_edges->RemoveCallback(ObserveAtomic, &impl_->edges);
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!g_request_metrics) return;

  const std::string route_label = g_route_labels ? std::string(route) : std::string("all");
  Emit(impl_->requests, std::uint64_t{1}, {{"route", route_label}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!g_request_metrics) return;

  const std::string route_label = g_route_labels ? std::string(route) : std::string("all");
  Emit(impl_->latency_ms, latency_ms, {{"route", route_label}});
}

void Metrics::ObserveCandidateCount(std::string_view bucket, std::uint64_t count) {
  if (!g_candidate_metrics) return;
  Emit(impl_->candidates, count, {{"bucket", std::string(bucket)}});
}

void Metrics::ObserveContextChars(std::uint64_t chars) {
  if (!g_candidate_metrics) return;
  Emit(impl_->context_chars, chars, {});
}

void Metrics::SetGraphSize(std::uint64_t vertices, std::uint64_t edges) {
  if (!g_graph_metrics) return;
  impl_->vertices.store(static_cast<std::int64_t>(vertices), std::memory_order_relaxed);
  impl_->edges.store(static_cast<std::int64_t>(edges), std::memory_order_relaxed);
}

} // namespace ragctx::observability

#else

namespace ragctx::observability {

struct Metrics::Impl {};

bool InitializeMetrics(const ragctx::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownMetrics() {
}

Metrics::Metrics() = default;

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, bool) {
}

void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

void Metrics::ObserveCandidateCount(std::string_view, std::uint64_t) {
}

void Metrics::ObserveContextChars(std::uint64_t) {
}

void Metrics::SetGraphSize(std::uint64_t, std::uint64_t) {
}

} // namespace ragctx::observability

#endif
