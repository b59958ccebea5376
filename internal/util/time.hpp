#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkcam::util {

/*
  Time utilities. Single place to control the clock source.

  Components take a ClockSource so tests can pin "now".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClockSource final : public ClockSource {
 public:
  TimePoint Now() const override;
};

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 2024-05-01T12-30-05-123Z: ISO-8601 UTC with ':' and '.' replaced so the
// result is safe inside a file name.
std::string ToFileSafeIso8601(TimePoint tp);

} // namespace chunkcam::util
