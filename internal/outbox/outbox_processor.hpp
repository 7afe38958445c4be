#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/outbox_record.hpp"
#include "internal/lock/distributed_lock.hpp"

namespace redrive::outbox {

using OutboxRecord = db::model::OutboxRecord;

// Delivers one event; throwing marks the delivery as failed.
using OutboxSink = std::function<void(const OutboxRecord&)>;

struct OutboxOptions {
  // A claim older than this is considered abandoned and may be re-claimed.
  uint64_t claim_timeout_ms   = 300000;
  uint64_t retry_base_ms      = 1000;
  uint32_t retry_max_exponent = 10;

  // Single-active-processor guard used by ProcessBatch.
  std::string               lock_name = "redrive:outbox-processor";
  std::chrono::milliseconds lock_ttl{60000};
};

struct OutboxBatchSummary {
  uint64_t claimed   = 0;
  uint64_t delivered = 0;
  uint64_t failed    = 0;
  // false when another processor held the guard lock.
  bool ran = true;
};

/*
  Consumer side of the transactional outbox.

  process_after is the only retry-scheduling field: a failed delivery
  bumps retry_count and pushes process_after out by RetryDelay, a
  successful one only sets processed_at.
*/
class OutboxProcessor {
 public:
  OutboxProcessor(std::shared_ptr<db::Repository> repository, OutboxOptions options = {},
                  std::shared_ptr<lock::DistributedLock> guard = nullptr);

  // Due records, now owned by processor_id, oldest first.
  std::vector<OutboxRecord> Claim(const std::string& processor_id, uint64_t batch_size);

  void Complete(uint64_t event_id, const std::string& processor_id, bool success, const std::string& error);

  OutboxBatchSummary ProcessBatch(const OutboxSink& sink, const std::string& processor_id, uint64_t batch_size);

  // base * 2^min(retry_count - 1, max_exponent)
  uint64_t RetryDelayMs(uint32_t retry_count) const;

  const OutboxOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository>        repository_;
  OutboxOptions                          options_;
  std::shared_ptr<lock::DistributedLock> guard_;
};

} // namespace redrive::outbox
