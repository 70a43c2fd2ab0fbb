#pragma once

#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace coolrouter::service {

// Runs fn, logging and rethrowing any failure with its route.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view request_id, Fn&& fn) {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    COOLROUTER_LOG_ERROR("RPC failed", {coolrouter::observability::StringField("route", route),
                                        coolrouter::observability::StringField("request_id", request_id),
                                        coolrouter::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace coolrouter::service
