#pragma once

#include <exception>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"

namespace redrive::util {

/*
  Runs a non-critical side effect.

  A failure is logged as a warning and never propagates to the caller.
  Returns true when the call completed without throwing.
*/
template <typename Fn>
bool BestEffort(std::string_view what, Fn&& fn) {
  try {
    std::forward<Fn>(fn)();
    return true;
  } catch (const std::exception& e) {
    REDRIVE_LOG_WARN("Best-effort step failed", {observability::StringField("step", what), observability::StringField("error", e.what())});
    return false;
  }
}

} // namespace redrive::util
