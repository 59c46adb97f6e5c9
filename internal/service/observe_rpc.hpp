#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"

namespace routebroker::service {

// Wraps one service call with a span, request metrics and error logging.
template <typename Fn>
auto ObserveRpc(std::string_view rpc, Fn&& fn) {
  routebroker::observability::SpanScope span(rpc);

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    routebroker::observability::Metrics::Instance().RecordRpc(
        rpc, success, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordError(ex.what());
    ROUTEBROKER_LOG_ERROR("RPC failed",
                          {routebroker::observability::StringField("rpc", rpc), routebroker::observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace routebroker::service
