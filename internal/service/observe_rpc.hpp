#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace resync::service {

// Wraps one RPC body: a span named after the route, a request counter and
// a latency sample. Exceptions pass through unchanged for the gRPC layer
// to translate.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  using Clock = std::chrono::steady_clock;

  observability::SpanScope span(route);
  span.SetAttribute("rpc.route", route);

  const auto begin  = Clock::now();
  auto       finish = [&](bool ok) {
    const std::chrono::duration<double, std::milli> elapsed = Clock::now() - begin;
    auto& metrics = observability::Metrics::Instance();
    metrics.RecordRequest(route, ok);
    metrics.ObserveRequestLatencyMs(route, elapsed.count());
    return elapsed;
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
    } else {
      auto response = fn();
      finish(true);
      return response;
    }
  } catch (const std::exception& ex) {
    const auto elapsed = finish(false);
    span.RecordException(ex.what());
    RESYNC_LOG_WARN("Request rejected",
                    {observability::StringField("route", route), observability::StringField("error", ex.what()),
                     observability::DurationField("elapsed", std::chrono::duration_cast<std::chrono::milliseconds>(elapsed))});
    throw;
  }
}

} // namespace resync::service
