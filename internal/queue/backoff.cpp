#include "backoff.hpp"

#include <algorithm>

namespace redrive::queue {

BackoffPolicy::BackoffPolicy(uint64_t idle_threshold_ms, uint64_t base_ms, uint64_t max_ms)
    : idle_threshold_ms_(idle_threshold_ms), base_ms_(base_ms), max_ms_(max_ms) {
}

uint64_t BackoffPolicy::RequiredIdle(uint64_t attempts) const {
  if (attempts == 0) {
    return idle_threshold_ms_;
  }

  const uint64_t shift = attempts - 1;
  if (shift >= 63 || base_ms_ > (max_ms_ >> shift)) {
    return max_ms_;
  }
  return std::min(max_ms_, base_ms_ << shift);
}

} // namespace redrive::queue
