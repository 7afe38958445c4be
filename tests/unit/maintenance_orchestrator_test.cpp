#include "internal/worker/maintenance_orchestrator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/run_transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/deadletter/dead_letter_pipeline.hpp"

namespace {

using namespace std::chrono_literals;

using redrive::db::memory::MemoryRepository;
using redrive::queue::FieldMap;
using redrive::worker::MaintenanceComponents;
using redrive::worker::MaintenanceOptions;
using redrive::worker::MaintenanceOrchestrator;
using redrive::worker::TaskResult;

namespace deadletter = redrive::deadletter;
namespace lock       = redrive::lock;
namespace outbox     = redrive::outbox;
namespace queue      = redrive::queue;
namespace retention  = redrive::retention;
namespace stream     = redrive::stream;

constexpr const char* kStream     = "test:work";
constexpr const char* kDeadLetter = "test:work:dead-letter";

struct Fixture {
  std::shared_ptr<MemoryRepository>    repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<stream::StreamStore> store      = std::make_shared<stream::StreamStore>(repository);
  std::shared_ptr<queue::DurableQueue> queue;
  MaintenanceComponents                components;

  Fixture() {
    queue::QueueOptions options;
    options.stream_key     = kStream;
    options.consumer_group = "test-workers";
    options.consumer_name  = "w1";
    queue                  = std::make_shared<queue::DurableQueue>(store, options);
    assert(queue->EnsureConsumerGroup());

    deadletter::DeadLetterOptions dl_options;
    dl_options.stream_key  = kDeadLetter;
    dl_options.replayed_by = "w1";
    auto dead_letters      = std::make_shared<deadletter::DeadLetterPipeline>(queue, repository, dl_options);

    components.locks     = std::make_shared<lock::DistributedLock>(repository);
    components.reclaim   = std::make_shared<queue::ReclaimScheduler>(queue, dead_letters, queue::BackoffSettings{1000, 60000});
    components.trimmer   = std::make_shared<deadletter::ArchiveTrimmer>(store, repository, kDeadLetter);
    components.outbox    = std::make_shared<outbox::OutboxProcessor>(repository, outbox::OutboxOptions{}, components.locks);
    components.retention = std::make_shared<retention::RetentionGC>(repository, queue);
  }

  // Leaves `count` messages pending for w1.
  void Stall(int count) {
    for (int i = 0; i < count; ++i) {
      assert(queue->Enqueue(FieldMap{{"candidate_id", "cand-" + std::to_string(i)}}, 0).has_value());
    }
    assert(queue->ConsumeBatch(count, 0ms).size() == static_cast<size_t>(count));
  }
};

MaintenanceOptions Options(const std::string& worker_id) {
  MaintenanceOptions options;
  options.worker_id                               = worker_id;
  options.interval                                = 20ms;
  options.lock_ttl                                = 10s;
  options.task_deadline                           = 5s;
  options.reclaim.idle_threshold_ms               = 0;
  options.reclaim.max_reclaims_before_dead_letter = 1;
  options.reclaim.max_reclaim_per_pass            = 10;
  options.dead_letter_max_length                  = 1;
  return options;
}

const TaskResult& Find(const std::vector<TaskResult>& results, const std::string& name) {
  for (const auto& r : results) {
    if (r.name == name) {
      return r;
    }
  }
  assert(false && "task missing");
  return results.front();
}

void TestCycleRunsEveryTaskInOrder() {
  Fixture                 f;
  MaintenanceOrchestrator orchestrator(f.components, Options("m1"));

  const auto results = orchestrator.RunCycle();
  const std::vector<std::string> expected = {"reclaim", "archive-trim", "outbox", "retention", "reclaim-counter-gc"};
  assert(results.size() == expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    assert(results[i].name == expected[i]);
    assert(results[i].ran);
    assert(results[i].ok);
  }
  assert(Find(results, "outbox").detail == "no sink configured");

  // Task locks are released after the cycle.
  for (const auto& name : expected) {
    assert(!f.components.locks->Holder(MaintenanceOrchestrator::TaskLockName(name)).has_value());
  }
}

void TestCycleDeadLettersAndTrims() {
  Fixture f;
  f.Stall(3);

  MaintenanceOrchestrator orchestrator(f.components, Options("m1"));
  const auto              results = orchestrator.RunCycle();

  const auto& reclaim = Find(results, "reclaim");
  assert(reclaim.detail.find("dead_lettered=3") != std::string::npos);
  assert(f.queue->Pending(100).empty());

  const auto& trim = Find(results, "archive-trim");
  assert(trim.detail.find("archived=2 trimmed=2") != std::string::npos);
  assert(f.store->Length(kDeadLetter) == 1);
}

void TestTaskSkippedWhileAnotherWorkerHoldsItsLock() {
  Fixture f;
  f.Stall(2);

  assert(f.components.locks->Acquire(MaintenanceOrchestrator::TaskLockName("reclaim"), "m2", 10s));

  MaintenanceOrchestrator orchestrator(f.components, Options("m1"));
  const auto              results = orchestrator.RunCycle();

  const auto& reclaim = Find(results, "reclaim");
  assert(!reclaim.ran);
  assert(reclaim.detail == "lock held by another worker");
  assert(f.queue->Pending(100).size() == 2);

  assert(Find(results, "archive-trim").ran);
  assert(f.components.locks->Holder(MaintenanceOrchestrator::TaskLockName("reclaim")) == std::optional<std::string>("m2"));
}

void TestOutboxDeliveredThroughSink() {
  Fixture f;

  redrive::db::model::OutboxRecord record;
  record.aggregate_type = "message";
  record.aggregate_id   = "a";
  record.event_kind     = "replayed";
  redrive::db::RunTransaction(*f.repository, [&](redrive::db::Transaction& tx) { assert(f.repository->InsertOutbox(tx, record)); });

  std::vector<std::string> delivered;
  f.components.outbox_sink = [&](const outbox::OutboxRecord& r) { delivered.push_back(r.aggregate_id); };

  MaintenanceOrchestrator orchestrator(f.components, Options("m1"));
  const auto              results = orchestrator.RunCycle();

  assert(delivered == std::vector<std::string>{"a"});
  assert(Find(results, "outbox").detail.find("delivered=1") != std::string::npos);
}

void TestDryRunRetentionDeletesNothing() {
  Fixture f;

  redrive::db::model::DeadLetterArchiveRecord archived;
  archived.dl_stream       = kDeadLetter;
  archived.dl_msg_id       = "1";
  archived.original_msg_id = "7";
  archived.payload_json    = "{}";
  archived.archived_at_ms  = 1000;
  archived.archived_by     = "test";
  redrive::db::RunTransaction(*f.repository,
                              [&](redrive::db::Transaction& tx) { assert(f.repository->UpsertDeadLetterArchive(tx, archived)); });

  auto options              = Options("m1");
  options.retention.dry_run = true;

  MaintenanceOrchestrator orchestrator(f.components, options);
  const auto              results = orchestrator.RunCycle();
  assert(Find(results, "retention").detail.find("dead_letter_archive=0/1") != std::string::npos);

  auto tx = f.repository->Begin();
  assert(f.repository->GetDeadLetterArchive(*tx, kDeadLetter, "1").has_value());
  tx->Commit();
}

void TestBackgroundLoop() {
  Fixture f;
  f.Stall(1);

  MaintenanceOrchestrator orchestrator(f.components, Options("m1"));
  orchestrator.Start();
  orchestrator.Start();

  for (int i = 0; i < 200 && f.store->Length(kDeadLetter) == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  orchestrator.Stop();
  orchestrator.Stop();

  assert(f.store->Length(kDeadLetter) == 1);
  assert(f.queue->Pending(100).empty());
}

} // namespace

int main() {
  TestCycleRunsEveryTaskInOrder();
  TestCycleDeadLettersAndTrims();
  TestTaskSkippedWhileAnotherWorkerHoldsItsLock();
  TestOutboxDeliveredThroughSink();
  TestDryRunRetentionDeletesNothing();
  TestBackgroundLoop();
  std::cout << "redrive_unit_maintenance_orchestrator: pass\n";
  return 0;
}
