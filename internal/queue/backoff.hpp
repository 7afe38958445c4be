#pragma once

#include <cstdint>

namespace redrive::queue {

/*
  Minimum idle time a pending message needs before it may be reclaimed again.

    attempts == 0  -> idle threshold
    attempts >= 1  -> min(max, base * 2^(attempts - 1))
*/
class BackoffPolicy {
 public:
  BackoffPolicy(uint64_t idle_threshold_ms, uint64_t base_ms, uint64_t max_ms);

  uint64_t RequiredIdle(uint64_t attempts) const;

  uint64_t IdleThreshold() const {
    return idle_threshold_ms_;
  }

 private:
  uint64_t idle_threshold_ms_;
  uint64_t base_ms_;
  uint64_t max_ms_;
};

} // namespace redrive::queue
