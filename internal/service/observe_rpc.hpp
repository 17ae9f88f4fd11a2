#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ragctx::service {

/*
  Wraps one service entry point: span, request count and latency, and an
  error log line. Exceptions are rethrown unchanged.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  ragctx::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("ragctx.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    ragctx::observability::Metrics::Instance().RecordRequest(route, success);
    ragctx::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RAGCTX_LOG_ERROR("request failed", {ragctx::observability::StringField("route", route), ragctx::observability::StringField("error", ex.what()),
                                        ragctx::observability::StringField("subject", subject)});
    finish(false);
    throw;
  }
}

} // namespace ragctx::service
