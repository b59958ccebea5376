#pragma once

#include <exception>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"

namespace chunkcam::util {

/*
  Runs a best-effort step (gallery export, post-upload delete, ...).

  Failures are logged at warn level and reported through the return value;
  they never propagate and never change item or session state.
*/
template <typename Fn>
bool RunNonCritical(std::string_view step, Fn&& fn) {
  try {
    std::forward<Fn>(fn)();
    return true;
  } catch (const std::exception& e) {
    CHUNKCAM_LOG_WARN("non-critical step failed",
                      {observability::StringField("step", step), observability::StringField("error", e.what())});
    return false;
  }
}

} // namespace chunkcam::util
