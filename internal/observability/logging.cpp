#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace ragctx::observability {
namespace {

constexpr const char* kLoggerName     = "ragctx";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment wins over the config file, the config file over the built-in default.
std::string EnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendField(fmt::memory_buffer& out, const LogField& field) {
  if (!NeedsQuoting(field.value)) {
    fmt::format_to(std::back_inserter(out), " {}={}", field.key, field.value);
    return;
  }

  fmt::format_to(std::back_inserter(out), " {}=\"", field.key);
  for (char c : field.value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') {
      out.push_back('\\');
      out.push_back('n');
      continue;
    }
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  fmt::format_to(std::back_inserter(out), " trace_id={} span_id={}", std::string_view(trace_id, sizeof(trace_id)),
                 std::string_view(span_id, sizeof(span_id)));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

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

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.4g}", value)};
}

void InitializeLogging(const ragctx::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(EnvOr("RAGCTX_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("RAGCTX_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  const auto include_trace = EnvOr("RAGCTX_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "", "false");
  g_include_trace_context  = include_trace == "1" || include_trace == "true";
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace ragctx::observability
