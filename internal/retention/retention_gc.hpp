#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/util/time.hpp"

namespace redrive::retention {

// Retention windows in days; 0 leaves the table untouched.
struct RetentionPolicy {
  uint32_t dead_letter_archive_days = 30;
  uint32_t replay_log_days          = 30;
  uint32_t outbox_days              = 30;
  bool     dry_run                  = false;
};

struct TableRetention {
  uint64_t candidates = 0;
  uint64_t deleted    = 0;
};

struct RetentionReport {
  std::map<std::string, TableRetention> tables;
  uint64_t                              errors    = 0;
  bool                                  completed = true;
};

/*
  Age-based garbage collection.

  A dry run counts exactly the rows a real run would delete and deletes
  nothing. Counting and deleting share one transaction per table.
*/
class RetentionGC {
 public:
  RetentionGC(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::DurableQueue> queue);

  RetentionReport RunAll(const RetentionPolicy& policy, const util::Deadline& deadline = {});

  // Expiry is the only criterion; there is no dry run.
  uint64_t CleanupExpiredLocks();

  // Counters no longer backed by a pending entry, or untouched for ttl_sec.
  // nullopt when the store failed.
  std::optional<TableRetention> CollectReclaimAttempts(uint64_t ttl_sec, bool dry_run, uint64_t scan_limit = 10000);

 private:
  TableRetention Collect(db::RetentionTable table, uint32_t days, bool dry_run);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<queue::DurableQueue> queue_;
};

} // namespace redrive::retention
