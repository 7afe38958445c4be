#include "internal/queue/reclaim_scheduler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/deadletter/dead_letter_pipeline.hpp"

namespace {

using redrive::db::memory::MemoryRepository;
using redrive::deadletter::DeadLetterOptions;
using redrive::deadletter::DeadLetterPipeline;
using redrive::queue::BackoffSettings;
using redrive::queue::DurableQueue;
using redrive::queue::FieldMap;
using redrive::queue::QueueOptions;
using redrive::queue::ReclaimOptions;
using redrive::queue::ReclaimScheduler;
using redrive::stream::StreamStore;

constexpr const char* kStream     = "test:work";
constexpr const char* kDeadLetter = "test:work:dead-letter";

struct Worker {
  std::shared_ptr<DurableQueue>       queue;
  std::shared_ptr<DeadLetterPipeline> dead_letters;
  std::shared_ptr<ReclaimScheduler>   scheduler;
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<StreamStore>      store      = std::make_shared<StreamStore>(repository);

  Worker MakeWorker(const std::string& consumer, BackoffSettings backoff = {1000, 60000}) {
    QueueOptions options;
    options.stream_key     = kStream;
    options.consumer_group = "test-workers";
    options.consumer_name  = consumer;

    Worker w;
    w.queue = std::make_shared<DurableQueue>(store, options);
    assert(w.queue->EnsureConsumerGroup());

    DeadLetterOptions dl_options;
    dl_options.stream_key  = kDeadLetter;
    dl_options.replayed_by = consumer;
    w.dead_letters         = std::make_shared<DeadLetterPipeline>(w.queue, repository, dl_options);
    w.scheduler            = std::make_shared<ReclaimScheduler>(w.queue, w.dead_letters, backoff);
    return w;
  }
};

ReclaimOptions Options(uint64_t idle_ms, uint64_t ceiling, uint64_t per_pass, bool use_backoff) {
  ReclaimOptions options;
  options.idle_threshold_ms               = idle_ms;
  options.max_reclaims_before_dead_letter = ceiling;
  options.max_reclaim_per_pass            = per_pass;
  options.use_backoff                     = use_backoff;
  options.scan_limit                      = 100;
  return options;
}

void EnqueueAndConsume(Worker& w, int count) {
  for (int i = 0; i < count; ++i) {
    assert(w.queue->Enqueue(FieldMap{{"candidate_id", "cand-" + std::to_string(i)}}, 0).has_value());
  }
  assert(w.queue->ConsumeBatch(count, std::chrono::milliseconds(0)).size() == static_cast<size_t>(count));
}

void TestRateLimitSkipsExcessCandidates() {
  Fixture f;
  auto    w = f.MakeWorker("c1");
  EnqueueAndConsume(w, 5);
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  const auto summary = w.scheduler->ReclaimStalled(Options(10, 3, 2, false));
  assert(summary.reclaimed == 2);
  assert(summary.skipped == 3);
  assert(summary.dead_lettered == 0);
  assert(summary.errors == 0);
}

void TestFreshEntriesAreDeferred() {
  Fixture f;
  auto    w = f.MakeWorker("c1");
  EnqueueAndConsume(w, 3);

  const auto summary = w.scheduler->ReclaimStalled(Options(60000, 3, 10, false));
  assert(summary.reclaimed == 0);
  assert(summary.backoff_deferred == 3);
}

void TestBackoffDefersAfterRepeatedReclaims() {
  Fixture f;
  auto    w = f.MakeWorker("c1", BackoffSettings{1000, 60000});
  EnqueueAndConsume(w, 1);
  const auto id = w.queue->Pending(1).at(0).id;

  // Three earlier reclaims: required idle is 1000 * 2^2 ms.
  for (int i = 0; i < 3; ++i) {
    w.queue->IncrementReclaimAttempts(id);
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  auto summary = w.scheduler->ReclaimStalled(Options(10, 10, 10, true));
  assert(summary.reclaimed == 0);
  assert(summary.backoff_deferred == 1);

  // Without backoff only the idle threshold applies.
  summary = w.scheduler->ReclaimStalled(Options(10, 10, 10, false));
  assert(summary.reclaimed == 1);
}

// Base backoff below the idle threshold: once the backoff has elapsed the
// entry is claimed even though it is not yet idle for the full threshold.
void TestBackoffShorterThanThresholdStillClaims() {
  Fixture f;
  auto    w = f.MakeWorker("c1", BackoffSettings{10, 60000});
  EnqueueAndConsume(w, 1);
  const auto id = w.queue->Pending(1).at(0).id;
  w.queue->IncrementReclaimAttempts(id);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const auto summary = w.scheduler->ReclaimStalled(Options(60000, 10, 10, true));
  assert(summary.reclaimed == 1);
  assert(summary.claim_missed == 0);
  assert(summary.backoff_deferred == 0);
  assert(w.queue->ReclaimAttempts(id) == 2);
}

void TestReclaimIncrementsCounter() {
  Fixture f;
  auto    w = f.MakeWorker("c1", BackoffSettings{5, 10});
  EnqueueAndConsume(w, 1);
  const auto id = w.queue->Pending(1).at(0).id;
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  const auto summary = w.scheduler->ReclaimStalled(Options(10, 10, 10, true));
  assert(summary.reclaimed == 1);
  assert(w.queue->ReclaimAttempts(id) == 1);

  const auto pending = w.queue->Pending(1);
  assert(pending.at(0).delivery_count == 2);
}

void TestCeilingDeadLettersIgnoringBackoff() {
  Fixture f;
  auto    w = f.MakeWorker("c1", BackoffSettings{3600000, 3600000});
  EnqueueAndConsume(w, 1);
  const auto id = w.queue->Pending(1).at(0).id;

  // First pass reclaims (delivery_count 1 -> 2).
  auto summary = w.scheduler->ReclaimStalled(Options(0, 2, 10, false));
  assert(summary.reclaimed == 1);

  // Backoff would defer for an hour, but the ceiling wins.
  w.queue->IncrementReclaimAttempts(id);
  summary = w.scheduler->ReclaimStalled(Options(0, 2, 10, true));
  assert(summary.dead_lettered == 1);
  assert(summary.reclaimed == 0);

  assert(w.queue->Pending(10).empty());
  assert(w.queue->ReclaimAttempts(id) == 0);
  assert(w.dead_letters->Count() == 1);

  const auto entry = w.dead_letters->Find(id);
  assert(entry.has_value());
  assert(entry->fields.at("reason") == redrive::queue::kMaxReclaimsExceeded);
  assert(entry->fields.at("orig_candidate_id") == "cand-0");
  assert(entry->fields.at("original_stream") == kStream);
}

void TestConcurrentReclaimHasSingleWinner() {
  Fixture f;
  auto    owner = f.MakeWorker("owner");
  auto    a     = f.MakeWorker("a");
  auto    b     = f.MakeWorker("b");
  EnqueueAndConsume(owner, 10);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  redrive::queue::ReclaimSummary sa;
  redrive::queue::ReclaimSummary sb;
  std::thread                    ta([&] { sa = a.scheduler->ReclaimStalled(Options(40, 10, 100, false)); });
  std::thread                    tb([&] { sb = b.scheduler->ReclaimStalled(Options(40, 10, 100, false)); });
  ta.join();
  tb.join();

  assert(sa.errors == 0 && sb.errors == 0);
  assert(sa.reclaimed + sb.reclaimed == 10);
  for (const auto& entry : owner.queue->Pending(100)) {
    assert(entry.delivery_count == 2);
    assert(entry.consumer == "a" || entry.consumer == "b");
  }
}

void TestTrimmedPendingEntryIsAckedNotDeadLettered() {
  Fixture f;
  auto    w = f.MakeWorker("c1");
  EnqueueAndConsume(w, 2);
  assert(f.store->Trim(kStream, 0) == 2);

  const auto summary = w.scheduler->ReclaimStalled(Options(0, 1, 10, false));
  assert(summary.dead_lettered == 0);
  assert(summary.errors == 0);
  assert(w.queue->Pending(10).empty());
  assert(w.dead_letters->Count() == 0);
}

void TestClaimStalledTransfersOwnership() {
  Fixture f;
  auto    owner = f.MakeWorker("owner");
  auto    other = f.MakeWorker("other");
  EnqueueAndConsume(owner, 2);

  assert(other.scheduler->ClaimStalled(60000, 10).empty());

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  const auto claimed = other.scheduler->ClaimStalled(10, 10);
  assert(claimed.size() == 2);
  assert(claimed[0].fields.at("candidate_id") == "cand-0");
  for (const auto& entry : owner.queue->Pending(10)) {
    assert(entry.consumer == "other");
  }
  // Never dead-letters.
  assert(other.dead_letters->Count() == 0);
}

} // namespace

int main() {
  TestRateLimitSkipsExcessCandidates();
  TestFreshEntriesAreDeferred();
  TestBackoffDefersAfterRepeatedReclaims();
  TestBackoffShorterThanThresholdStillClaims();
  TestReclaimIncrementsCounter();
  TestCeilingDeadLettersIgnoringBackoff();
  TestConcurrentReclaimHasSingleWinner();
  TestTrimmedPendingEntryIsAckedNotDeadLettered();
  TestClaimStalledTransfersOwnership();

  std::cout << "redrive_unit_reclaim_scheduler: pass\n";
  return 0;
}
