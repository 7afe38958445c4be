#include "distributed_lock.hpp"

#include "internal/db/api/run_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace redrive::lock {

using observability::IntField;
using observability::StringField;

namespace {

uint64_t TtlMillis(std::chrono::milliseconds ttl) {
  return ttl.count() > 0 ? static_cast<uint64_t>(ttl.count()) : 0;
}

} // namespace

DistributedLock::DistributedLock(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

bool DistributedLock::Acquire(const std::string& name, const std::string& holder, std::chrono::milliseconds ttl) {
  try {
    const auto affected = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      const auto now = util::NowMillis();
      const auto r   = repository_->AcquireLock(tx, name, holder, now, now + TtlMillis(ttl));
      db::ThrowIfError(r, "acquire lock");
      return r.affected;
    });
    if (affected == 0) {
      REDRIVE_LOG_DEBUG("Lock held by another holder", {StringField("lock", name), StringField("holder", holder)});
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to acquire lock", {StringField("lock", name), StringField("holder", holder), StringField("error", e.what())});
    return false;
  }
}

bool DistributedLock::Extend(const std::string& name, const std::string& holder, std::chrono::milliseconds ttl) {
  try {
    const auto affected = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      const auto now = util::NowMillis();
      const auto r   = repository_->ExtendLock(tx, name, holder, now, now + TtlMillis(ttl));
      db::ThrowIfError(r, "extend lock");
      return r.affected;
    });
    if (affected == 0) {
      REDRIVE_LOG_WARN("Lock extension refused, not the holder", {StringField("lock", name), StringField("holder", holder)});
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to extend lock", {StringField("lock", name), StringField("holder", holder), StringField("error", e.what())});
    return false;
  }
}

bool DistributedLock::Release(const std::string& name, const std::string& holder) {
  try {
    const auto affected = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      const auto r = repository_->ReleaseLock(tx, name, holder);
      db::ThrowIfError(r, "release lock");
      return r.affected;
    });
    return affected > 0;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to release lock", {StringField("lock", name), StringField("holder", holder), StringField("error", e.what())});
    return false;
  }
}

uint64_t DistributedLock::CleanupExpired() {
  try {
    const auto removed = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      const auto r = repository_->DeleteExpiredLocks(tx, util::NowMillis());
      db::ThrowIfError(r, "cleanup expired locks");
      return r.affected;
    });
    if (removed > 0) {
      REDRIVE_LOG_INFO("Removed expired locks", {IntField("count", static_cast<int64_t>(removed))});
    }
    return removed;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to clean up expired locks", {StringField("error", e.what())});
    return 0;
  }
}

std::optional<std::string> DistributedLock::Holder(const std::string& name) {
  try {
    auto tx     = repository_->Begin();
    auto record = repository_->GetLock(*tx, name);
    tx->Commit();
    if (!record || record->expires_at_ms < util::NowMillis()) {
      return std::nullopt;
    }
    return record->holder_id;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to read lock", {StringField("lock", name), StringField("error", e.what())});
    return std::nullopt;
  }
}

// ---------------------------------------------------------------------------

ScopedLock::ScopedLock(DistributedLock& lock, std::string name, std::string holder, std::chrono::milliseconds ttl)
    : lock_(lock), name_(std::move(name)), holder_(std::move(holder)), ttl_(ttl) {
  acquired_ = lock_.Acquire(name_, holder_, ttl_);
}

ScopedLock::~ScopedLock() {
  if (acquired_) {
    lock_.Release(name_, holder_);
  }
}

bool ScopedLock::Extend() {
  if (!acquired_) {
    return false;
  }
  acquired_ = lock_.Extend(name_, holder_, ttl_);
  return acquired_;
}

} // namespace redrive::lock
