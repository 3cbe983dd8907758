#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace orchestrator::service {

/*
  Span, request metrics and failure logging around one RPC body. Exceptions
  are rethrown for the transport layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  orchestrator::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    orchestrator::observability::Metrics::Instance().RecordRequest(route, success);
    orchestrator::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    ORCHESTRATOR_LOG_WARN("RPC failed", {orchestrator::observability::StringField("route", route),
                                         orchestrator::observability::StringField("subject", subject),
                                         orchestrator::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace orchestrator::service
