#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace ragctx::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using TracingConfig = ragctx::runtime::config::ObservabilityConfig::TracingConfig;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> BuildProcessor(const TracingConfig& tracing, std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (tracing.processor() == TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  // zero keeps the SDK default
  sdktrace::BatchSpanProcessorOptions options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

} // namespace

bool InitializeTracing(const ragctx::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings  = ResolveOtlpSettings(observability, OtlpSignal::kTraces);
  auto       processor = BuildProcessor(observability.tracing(), BuildExporter(settings));

  const auto service = resource::Resource::Create(
      {{"service.name", std::string(kServiceName)}, {"service.version", std::string(kServiceVersion)}});

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), service));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(std::string(kServiceName), std::string(kServiceVersion));
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  if (g_tracer) {
    impl_ = std::make_unique<Impl>(g_tracer->StartSpan(std::string(name)));
  }
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace ragctx::observability

#else

namespace ragctx::observability {

struct SpanScope::Impl {};

bool InitializeTracing(const ragctx::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownTracing() {
}

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::RecordException(std::string_view) {
}

} // namespace ragctx::observability

#endif
