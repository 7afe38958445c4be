#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace redrive::lock {

/*
  TTL lock keyed by (name, holder).

  Every operation is one compare-and-set in the store, so a lock row is
  owned by at most one unexpired holder at a time. Losing a race is
  reported as false, never thrown.
*/
class DistributedLock {
 public:
  explicit DistributedLock(std::shared_ptr<db::Repository> repository);

  // Succeeds when the lock is free, expired, or already held by `holder`.
  bool Acquire(const std::string& name, const std::string& holder, std::chrono::milliseconds ttl);

  // Only the current, unexpired holder can extend.
  bool Extend(const std::string& name, const std::string& holder, std::chrono::milliseconds ttl);

  bool Release(const std::string& name, const std::string& holder);

  // Number of expired lock rows removed.
  uint64_t CleanupExpired();

  // Current unexpired holder, if any.
  std::optional<std::string> Holder(const std::string& name);

 private:
  std::shared_ptr<db::Repository> repository_;
};

// Releases the lock on destruction when it was acquired.
class ScopedLock {
 public:
  ScopedLock(DistributedLock& lock, std::string name, std::string holder, std::chrono::milliseconds ttl);
  ~ScopedLock();

  ScopedLock(const ScopedLock&)            = delete;
  ScopedLock& operator=(const ScopedLock&) = delete;

  bool Acquired() const {
    return acquired_;
  }

  explicit operator bool() const {
    return acquired_;
  }

  // Pushes the expiry out by another ttl; false when ownership was lost.
  bool Extend();

 private:
  DistributedLock&          lock_;
  std::string               name_;
  std::string               holder_;
  std::chrono::milliseconds ttl_;
  bool                      acquired_ = false;
};

} // namespace redrive::lock
