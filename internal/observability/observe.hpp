#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "spans.hpp"

namespace workledger::observability {

/*
  Wraps one ledger operation: span, count/latency metrics, an error log
  line on failure. Exceptions are rethrown untouched.

  attributes (request_id, coll_id, ...) go on the span and on the error
  line.
*/
template <typename Fn>
auto ObserveOperation(std::string_view operation, std::initializer_list<LogField> attributes, Fn&& fn) {
  SpanScope span(operation);
  for (const auto& attribute : attributes) {
    span.SetAttribute(attribute.key, attribute.value);
  }

  auto&      metrics    = Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    metrics.RecordOperation(operation, success);
    metrics.ObserveOperationLatencyMs(operation,
                                      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    finish(false);

    std::vector<LogField> fields{StringField("operation", operation)};
    fields.insert(fields.end(), attributes.begin(), attributes.end());
    fields.push_back(StringField("error", ex.what()));
    Log(spdlog::level::err, "operation failed", fields);
    throw;
  }
}

template <typename Fn>
auto ObserveOperation(std::string_view operation, Fn&& fn) {
  return ObserveOperation(operation, {}, std::forward<Fn>(fn));
}

} // namespace workledger::observability
