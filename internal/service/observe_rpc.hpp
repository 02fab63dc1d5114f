#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace dispatch::service {

/*
  Wraps one RPC body: span, request counter, latency histogram and an
  error log. Exceptions are rethrown for the transport to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view trip_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!trip_id.empty()) {
    span.SetAttribute("trip.id", trip_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool ok) {
    observability::Metrics::Instance().RecordRequest(route, ok);
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
    DISPATCH_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                      observability::StringField("trip_id", trip_id)});
    finish(false);
    throw;
  }
}

} // namespace dispatch::service
