#include "internal/db/api/run_transaction.hpp"

#include <chrono>
#include <random>
#include <string>
#include <thread>

namespace redrive::db {

namespace detail {

void PauseAfterConflict(int attempt) {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<int> jitter(0, 500 * attempt);
  std::this_thread::sleep_for(std::chrono::microseconds(200 + jitter(rng)));
}

} // namespace detail

void ThrowIfError(const Result& result, const char* what) {
  if (!result) {
    throw util::StoreUnavailable(std::string(what) + ": " + ToString(result.code) + (result.message.empty() ? "" : " " + result.message));
  }
}

} // namespace redrive::db
