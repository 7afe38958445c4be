#include "internal/retention/retention_gc.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/api/run_transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/distributed_lock.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;

using redrive::db::RunTransaction;
using redrive::db::Transaction;
using redrive::db::memory::MemoryRepository;
using redrive::queue::DurableQueue;
using redrive::queue::FieldMap;
using redrive::queue::QueueOptions;
using redrive::retention::RetentionGC;
using redrive::retention::RetentionPolicy;
using redrive::stream::StreamStore;

namespace model = redrive::db::model;

constexpr uint64_t kDay = 86400000ULL;

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<StreamStore>      store      = std::make_shared<StreamStore>(repository);
  std::shared_ptr<DurableQueue>     queue;
  std::unique_ptr<RetentionGC>      gc;

  Fixture() {
    QueueOptions options;
    options.stream_key     = "test:work";
    options.consumer_group = "test-workers";
    options.consumer_name  = "w1";
    queue                  = std::make_shared<DurableQueue>(store, options);
    assert(queue->EnsureConsumerGroup());
    gc = std::make_unique<RetentionGC>(repository, queue);
  }

  void Archive(const std::string& dl_id, uint64_t archived_at_ms) {
    model::DeadLetterArchiveRecord record;
    record.dl_stream       = "test:work:dead-letter";
    record.dl_msg_id       = dl_id;
    record.original_msg_id = "orig-" + dl_id;
    record.payload_json    = "{}";
    record.reason          = "max_retries_exceeded";
    record.archived_at_ms  = archived_at_ms;
    record.archived_by     = "test";
    RunTransaction(*repository, [&](Transaction& tx) { assert(repository->UpsertDeadLetterArchive(tx, record)); });
  }

  void Replayed(const std::string& original_id, uint64_t replayed_at_ms) {
    model::ReplayLogRecord record;
    record.original_stream = "test:work";
    record.original_msg_id = original_id;
    record.dl_msg_id       = "dl-" + original_id;
    record.replayed_by     = "test";
    record.replayed_at_ms  = replayed_at_ms;
    RunTransaction(*repository, [&](Transaction& tx) { assert(repository->InsertReplayLogIfAbsent(tx, record)); });
  }

  // Inserts, claims and completes one outbox record at now_ms.
  uint64_t ProcessedOutbox(uint64_t processed_at_ms) {
    model::OutboxRecord record;
    record.aggregate_type = "message";
    record.aggregate_id   = "a";
    record.event_kind     = "replayed";
    record.payload_json   = "{}";
    return RunTransaction(*repository, [&](Transaction& tx) {
      assert(repository->InsertOutbox(tx, record));
      const auto claimed = repository->ClaimOutbox(tx, "p", 100, redrive::util::NowMillis(), 0);
      assert(!claimed.empty());
      assert(repository->MarkOutboxProcessed(tx, record.id, "p", processed_at_ms).affected == 1);
      return record.id;
    });
  }

  bool HasArchive(const std::string& dl_id) {
    auto tx    = repository->Begin();
    auto found = repository->GetDeadLetterArchive(*tx, "test:work:dead-letter", dl_id).has_value();
    tx->Commit();
    return found;
  }

  bool HasReplayLog(const std::string& original_id) {
    auto tx    = repository->Begin();
    auto found = repository->GetReplayLog(*tx, "test:work", original_id).has_value();
    tx->Commit();
    return found;
  }
};

void Seed(Fixture& f) {
  const auto now = redrive::util::NowMillis();
  f.Archive("old-1", now - 40 * kDay);
  f.Archive("old-2", now - 31 * kDay);
  f.Archive("fresh", now - 1 * kDay);
  f.Replayed("old", now - 45 * kDay);
  f.Replayed("fresh", now - 2 * kDay);
  f.ProcessedOutbox(now - 60 * kDay);
  f.ProcessedOutbox(now - 10 * kDay);
}

void TestDryRunCountsWithoutDeleting() {
  Fixture f;
  Seed(f);

  RetentionPolicy policy;
  policy.dry_run = true;

  const auto report = f.gc->RunAll(policy);
  assert(report.completed);
  assert(report.errors == 0);
  assert(report.tables.size() == 3);
  assert(report.tables.at("dead_letter_archive").candidates == 2);
  assert(report.tables.at("replay_log").candidates == 1);
  assert(report.tables.at("outbox").candidates == 1);
  for (const auto& [_, table] : report.tables) {
    assert(table.deleted == 0);
  }
  assert(f.HasArchive("old-1"));
  assert(f.HasReplayLog("old"));
}

void TestRealRunDeletesWhatDryRunCounted() {
  Fixture f;
  Seed(f);

  RetentionPolicy dry;
  dry.dry_run           = true;
  const auto prediction = f.gc->RunAll(dry);

  const auto report = f.gc->RunAll(RetentionPolicy{});
  for (const auto& [name, table] : report.tables) {
    assert(table.candidates == prediction.tables.at(name).candidates);
    assert(table.deleted == table.candidates);
  }
  assert(!f.HasArchive("old-1"));
  assert(!f.HasArchive("old-2"));
  assert(f.HasArchive("fresh"));
  assert(!f.HasReplayLog("old"));
  assert(f.HasReplayLog("fresh"));

  // Nothing left past the window.
  const auto again = f.gc->RunAll(RetentionPolicy{});
  for (const auto& [_, table] : again.tables) {
    assert(table.candidates == 0);
  }
}

void TestUnprocessedOutboxIsKept() {
  Fixture f;
  model::OutboxRecord pending;
  pending.aggregate_type = "message";
  pending.aggregate_id   = "a";
  pending.event_kind     = "replayed";
  pending.created_at_ms  = redrive::util::NowMillis() - 90 * kDay;
  RunTransaction(*f.repository, [&](Transaction& tx) { assert(f.repository->InsertOutbox(tx, pending)); });

  const auto report = f.gc->RunAll(RetentionPolicy{});
  assert(report.tables.at("outbox").candidates == 0);

  auto tx = f.repository->Begin();
  assert(f.repository->GetOutbox(*tx, pending.id).has_value());
  tx->Commit();
}

void TestZeroDaysSkipsTable() {
  Fixture f;
  Seed(f);

  RetentionPolicy policy;
  policy.replay_log_days = 0;
  policy.outbox_days     = 0;

  const auto report = f.gc->RunAll(policy);
  assert(report.tables.size() == 1);
  assert(report.tables.count("dead_letter_archive") == 1);
  assert(f.HasReplayLog("old"));
}

void TestExpiredDeadlineStopsEarly() {
  Fixture f;
  Seed(f);

  const auto report = f.gc->RunAll(RetentionPolicy{}, redrive::util::Deadline::After(0ms));
  assert(!report.completed);
  assert(report.tables.empty());
  assert(f.HasArchive("old-1"));
}

void TestCleanupExpiredLocks() {
  Fixture                         f;
  redrive::lock::DistributedLock locks(f.repository);
  assert(locks.Acquire("short", "h1", 10ms));
  assert(locks.Acquire("long", "h1", 60s));

  std::this_thread::sleep_for(50ms);
  assert(f.gc->CleanupExpiredLocks() == 1);
  assert(locks.Holder("long") == std::optional<std::string>("h1"));

  auto tx = f.repository->Begin();
  assert(!f.repository->GetLock(*tx, "short").has_value());
  tx->Commit();
}

void TestCollectReclaimAttempts() {
  Fixture f;
  const auto kept   = f.queue->Enqueue(FieldMap{{"candidate_id", "c1"}}, 0);
  const auto orphan = f.queue->Enqueue(FieldMap{{"candidate_id", "c2"}}, 0);
  assert(kept && orphan);
  assert(f.queue->ConsumeBatch(10, 0ms).size() == 2);

  assert(f.queue->IncrementReclaimAttempts(*kept) == 1);
  assert(f.queue->IncrementReclaimAttempts(*orphan) == 1);

  // Acked behind the queue's back, leaving its counter without a pending entry.
  assert(f.store->Ack("test:work", "test-workers", *orphan) == 1);

  const auto dry = f.gc->CollectReclaimAttempts(3600, true);
  assert(dry.has_value());
  assert(dry->candidates == 1);
  assert(dry->deleted == 0);
  assert(f.queue->ReclaimAttempts(*orphan) == 1);

  const auto real = f.gc->CollectReclaimAttempts(3600, false);
  assert(real.has_value());
  assert(real->deleted == 1);
  assert(f.queue->ReclaimAttempts(*orphan) == 0);
  assert(f.queue->ReclaimAttempts(*kept) == 1);

  // Past the ttl even a live counter goes.
  std::this_thread::sleep_for(20ms);
  const auto aged = f.gc->CollectReclaimAttempts(0, false);
  assert(aged.has_value());
  assert(aged->deleted == 1);
  assert(f.queue->ReclaimAttempts(*kept) == 0);
}

} // namespace

int main() {
  TestDryRunCountsWithoutDeleting();
  TestRealRunDeletesWhatDryRunCounted();
  TestUnprocessedOutboxIsKept();
  TestZeroDaysSkipsTable();
  TestExpiredDeadlineStopsEarly();
  TestCleanupExpiredLocks();
  TestCollectReclaimAttempts();
  std::cout << "redrive_unit_retention_gc: pass\n";
  return 0;
}
