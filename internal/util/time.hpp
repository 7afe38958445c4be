#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace redrive::util {

/*
  Wall-clock helpers. Stored timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
uint64_t  NowMillis();

// 2024-01-02T03:04:05.678Z
std::string ToIso8601(TimePoint tp);

/*
  Deadline for bounded batch jobs.

  A default-constructed deadline never expires.
*/
class Deadline {
 public:
  Deadline() = default;

  static Deadline After(std::chrono::milliseconds budget) {
    Deadline d;
    d.at_      = std::chrono::steady_clock::now() + budget;
    d.bounded_ = true;
    return d;
  }

  bool Expired() const {
    return bounded_ && std::chrono::steady_clock::now() >= at_;
  }

 private:
  std::chrono::steady_clock::time_point at_{};
  bool                                  bounded_ = false;
};

} // namespace redrive::util
