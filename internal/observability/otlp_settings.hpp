#pragma once

#include <string>
#include <string_view>

namespace ragctx::runtime::config {
class ObservabilityConfig;
}

namespace ragctx::observability {

inline constexpr std::string_view kServiceName    = "ragctx";
inline constexpr std::string_view kServiceVersion = "0.1.0";

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpSettings {
  std::string endpoint;
  bool        http     = false;
  bool        insecure = true;
};

/*
  Exporter endpoint for one signal.

  Precedence: observability.otlp_endpoint, then
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the configured transport.
*/
OtlpSettings ResolveOtlpSettings(const ragctx::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

} // namespace ragctx::observability
