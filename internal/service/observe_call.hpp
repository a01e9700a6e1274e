#pragma once

#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace ingest::service {

/*
  Wraps a service call in a span and logs failures.

  Domain errors (validation, not found) log at warn; anything else is
  unexpected and logs at error. The exception always propagates.
*/
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const util::Error& ex) {
    span.RecordException(ex.what());
    INGEST_LOG_WARN("call rejected", {observability::StringField("route", route), observability::StringField("code", util::ErrorCodeName(ex.code())),
                                      observability::StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    INGEST_LOG_ERROR("call failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace ingest::service
