#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace registrar::service {

/*
  Runs one service call inside a span and records its outcome.

  Caller errors (util::RecordsError) count as "rejected" and log at warn
  with the offending key; anything else is a server fault, counts as
  "failed" and logs at error. The exception is always rethrown for the
  transport to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  registrar::observability::SpanScope span(route);
  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](std::string_view outcome) {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started_at;
    registrar::observability::Metrics::Instance().RecordCall(route, outcome, elapsed.count());
    return static_cast<std::int64_t>(elapsed.count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
      fn();
      finish("ok");
      return;
    } else {
      auto result = fn();
      finish("ok");
      return result;
    }
  } catch (const registrar::util::RecordsError& ex) {
    span.SetAttribute("registrar.key", ex.key());
    span.RecordError(ex.what());
    const auto duration_ms = finish("rejected");
    REGISTRAR_LOG_WARN("RPC rejected",
                       {registrar::observability::StringField("route", route), registrar::observability::StringField("key", ex.key()),
                        registrar::observability::StringField("error", ex.what()), registrar::observability::IntField("duration_ms", duration_ms)});
    throw;
  } catch (const std::exception& ex) {
    span.RecordError(ex.what());
    const auto duration_ms = finish("failed");
    REGISTRAR_LOG_ERROR("RPC failed",
                        {registrar::observability::StringField("route", route), registrar::observability::StringField("error", ex.what()),
                         registrar::observability::IntField("duration_ms", duration_ms)});
    throw;
  }
}

}
