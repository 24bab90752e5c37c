#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace tsbatch::service {

/*
  Runs one RPC body, recording outcome metrics and logging failures
  before rethrowing them to the transport adapter.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    tsbatch::observability::Metrics::Instance().RecordRequest(route, true);
    return result;
  } catch (const std::exception& ex) {
    TSBATCH_LOG_ERROR("RPC failed",
                      {tsbatch::observability::StringField("route", route), tsbatch::observability::StringField("error", ex.what()),
                       tsbatch::observability::IntField(
                           "elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count())});
    tsbatch::observability::Metrics::Instance().RecordRequest(route, false);
    throw;
  }
}

} // namespace tsbatch::service
