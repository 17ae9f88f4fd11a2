#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace ragctx::runtime::config {
class RuntimeConfig;
}

namespace ragctx::observability {

// Both return false when the signal is disabled in config or the build has no ENABLE_OTEL.
bool InitializeTracing(const ragctx::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ragctx::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  One span per service call, active for the lifetime of the object.
  Every member is a no-op when tracing is not initialized.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/*
  Process-wide instruments.

    ragctx.request.count, ragctx.request.latency_ms   by route
    ragctx.context.candidates                         by bucket (critical, direct, linked)
    ragctx.context.chars                              per assembled context
    ragctx.graph.vertices, ragctx.graph.edges         last published link graph size
*/
class Metrics {
 public:
  static Metrics& Instance();
  ~Metrics();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveCandidateCount(std::string_view bucket, std::uint64_t count);
  void ObserveContextChars(std::uint64_t chars);
  void SetGraphSize(std::uint64_t vertices, std::uint64_t edges);

 private:
  Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace ragctx::observability
