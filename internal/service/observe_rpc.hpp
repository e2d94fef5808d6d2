#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace planner::service {

/*
  Wraps one service call with a span, request metrics and an error log.
  Exceptions are rethrown for the transport adapter to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view session_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!session_id.empty()) {
    span.SetAttribute("session.id", session_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    PLANNER_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                     observability::StringField("session_id", session_id)});
    finish(false);
    throw;
  }
}

} // namespace planner::service
