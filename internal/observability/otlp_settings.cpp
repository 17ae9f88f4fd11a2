#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace ragctx::observability {

namespace {

const char* NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

OtlpSettings ResolveOtlpSettings(const ragctx::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  OtlpSettings settings;
  settings.http = config.transport() == ragctx::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
    return settings;
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = NonEmptyEnv(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* shared = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = shared;
  } else if (settings.http) {
    settings.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }
  return settings;
}

} // namespace ragctx::observability
