#include "internal/queue/backoff.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

namespace {

using redrive::queue::BackoffPolicy;

void TestZeroAttemptsUsesIdleThreshold() {
  const BackoffPolicy policy(300000, 60000, 86400000);
  assert(policy.RequiredIdle(0) == 300000);
  assert(policy.IdleThreshold() == 300000);
}

void TestDoublesPerAttempt() {
  const BackoffPolicy policy(300000, 60000, 86400000);
  assert(policy.RequiredIdle(1) == 60000);
  assert(policy.RequiredIdle(2) == 120000);
  assert(policy.RequiredIdle(3) == 240000);
  assert(policy.RequiredIdle(4) == 480000);
}

void TestCappedAtMax() {
  const BackoffPolicy policy(300000, 60000, 86400000);
  // 60000 * 2^11 = 122880000 > max
  assert(policy.RequiredIdle(12) == 86400000);
  assert(policy.RequiredIdle(64) == 86400000);
  assert(policy.RequiredIdle(std::numeric_limits<uint64_t>::max()) == 86400000);
}

void TestMonotonicNonDecreasing() {
  const BackoffPolicy policy(1000, 250, 3600000);
  uint64_t            previous = policy.RequiredIdle(1);
  for (uint64_t attempts = 2; attempts < 200; ++attempts) {
    const auto current = policy.RequiredIdle(attempts);
    assert(current >= previous);
    assert(current <= 3600000);
    previous = current;
  }
}

} // namespace

int main() {
  TestZeroAttemptsUsesIdleThreshold();
  TestDoublesPerAttempt();
  TestCappedAtMax();
  TestMonotonicNonDecreasing();

  std::cout << "redrive_unit_backoff: pass\n";
  return 0;
}
