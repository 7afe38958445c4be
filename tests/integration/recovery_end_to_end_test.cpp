#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/worker/maintenance_orchestrator.hpp"
#include "internal/worker/queue_worker.hpp"

namespace {

using namespace std::chrono_literals;

using redrive::config::ConfigLoader;
using redrive::queue::Delivery;
using redrive::queue::WorkItem;
using redrive::worker::MaintenanceOrchestrator;
using redrive::worker::QueueWorker;
using redrive::worker::QueueWorkerOptions;
using redrive::worker::TaskResult;

const TaskResult& Task(const std::vector<TaskResult>& results, const std::string& name) {
  for (const auto& r : results) {
    if (r.name == name) {
      return r;
    }
  }
  assert(false && "task missing");
  return results.front();
}

redrive::runtime::config::RuntimeConfig MakeConfig() {
  for (const char* key : {"REDRIVE_STREAM_KEY", "REDRIVE_CONSUMER_NAME", "REDRIVE_STREAM_MAX_LEN", "REDRIVE_CLAIM_IDLE_MS",
                          "REDRIVE_DEAD_LETTER_STREAM", "REDRIVE_DEAD_LETTER_MAX_LEN", "REDRIVE_SQLITE_PATH"}) {
    unsetenv(key);
  }

  auto config = ConfigLoader::Load("");
  assert(config.database().has_memory());

  auto* queue = config.mutable_queue();
  queue->set_stream_key("e2e:work");
  queue->set_consumer_name("e2e-worker");
  queue->set_claim_idle_ms(0);
  queue->set_block_ms(0);
  queue->set_max_reclaim_attempts(2);
  queue->set_disable_backoff(true);

  auto* dead_letter = config.mutable_dead_letter();
  dead_letter->set_stream_key("e2e:work:dead-letter");
  dead_letter->set_max_length(1);

  config.mutable_worker()->set_worker_id("e2e-maintenance");
  return config;
}

void TestStalledWorkIsDeadLetteredArchivedAndReplayed() {
  const auto config = MakeConfig();
  auto       deps   = redrive::factory::BuildRuntime(config);

  // Producer side.
  for (int i = 0; i < 3; ++i) {
    WorkItem item;
    item.candidate_id = "c" + std::to_string(i);
    item.priority     = 0.5;
    assert(deps.queue->Enqueue(item).has_value());
  }

  // A consumer that keeps failing leaves everything pending.
  QueueWorker failing(deps.queue, [](const Delivery&) { return false; }, QueueWorkerOptions{10, 0ms});
  const auto  pass = failing.RunOnce();
  assert(pass.consumed == 3);
  assert(pass.failed == 3);
  assert(deps.queue->Pending(100).size() == 3);

  redrive::worker::MaintenanceComponents components;
  components.reclaim   = deps.reclaim;
  components.trimmer   = deps.trimmer;
  components.outbox    = deps.outbox;
  components.retention = deps.retention;
  components.locks     = deps.locks;

  MaintenanceOrchestrator orchestrator(components, redrive::factory::MaintenanceOptionsFrom(config));

  // First cycle: reclaimed once, still under the ceiling.
  auto results = orchestrator.RunCycle();
  assert(Task(results, "reclaim").detail.find("reclaimed=3") != std::string::npos);
  assert(deps.dead_letters->Count() == 0);

  // Second cycle: at the ceiling, dead-lettered, then the dead-letter stream is trimmed to one entry.
  results = orchestrator.RunCycle();
  assert(Task(results, "reclaim").detail.find("dead_lettered=3") != std::string::npos);
  assert(Task(results, "archive-trim").detail.find("archived=2 trimmed=2") != std::string::npos);
  for (const auto& r : results) {
    assert(r.ran && r.ok);
  }
  assert(deps.queue->Pending(100).empty());
  assert(deps.dead_letters->Count() == 1);

  {
    auto tx       = deps.repository->Begin();
    auto archived = deps.repository->GetDeadLetterArchive(*tx, "e2e:work:dead-letter", "1");
    tx->Commit();
    assert(archived.has_value());
    assert(archived->original_msg_id == "1");
    assert(archived->candidate_id == std::optional<std::string>("c0"));
    assert(archived->archived_by == "stream_trim");
  }

  // The surviving entry is the newest one.
  const auto survivor = deps.dead_letters->Find("3");
  assert(survivor.has_value());

  redrive::deadletter::ReplayAllOptions replay;
  replay.batch_size = 10;
  const auto summary = deps.dead_letters->ReplayAll(replay);
  assert(summary.replayed == 1);
  assert(summary.errors == 0);
  assert(summary.completed);
  assert(deps.dead_letters->Count() == 0);

  {
    auto tx     = deps.repository->Begin();
    auto ledger = deps.repository->GetReplayLog(*tx, "e2e:work", "3");
    tx->Commit();
    assert(ledger.has_value());
    assert(ledger->new_msg_id.has_value());
    assert(ledger->candidate_id == std::optional<std::string>("c2"));
  }

  // The replayed message is ordinary work again.
  std::vector<std::string> handled;
  QueueWorker              healthy(
      deps.queue,
      [&](const Delivery& d) {
        handled.push_back(d.fields.at("candidate_id"));
        return true;
      },
      QueueWorkerOptions{10, 0ms});
  const auto healed = healthy.RunOnce();
  assert(healed.acked == 1);
  assert(handled == std::vector<std::string>{"c2"});
  assert(deps.queue->Pending(100).empty());

  // Nothing left to replay, and nothing is old enough for retention.
  assert(deps.dead_letters->ReplayAll(replay).replayed == 0);

  redrive::retention::RetentionPolicy policy;
  policy.dry_run    = true;
  const auto report = deps.retention->RunAll(policy);
  assert(report.errors == 0);
  for (const auto& [_, table] : report.tables) {
    assert(table.candidates == 0);
  }
}

void TestSecondWorkerSkipsLockedTasks() {
  const auto config = MakeConfig();
  auto       deps   = redrive::factory::BuildRuntime(config);

  redrive::worker::MaintenanceComponents components;
  components.reclaim   = deps.reclaim;
  components.trimmer   = deps.trimmer;
  components.outbox    = deps.outbox;
  components.retention = deps.retention;
  components.locks     = deps.locks;

  auto other_options      = redrive::factory::MaintenanceOptionsFrom(config);
  other_options.worker_id = "other-maintenance";

  // Another worker is mid-retention.
  assert(deps.locks->Acquire(MaintenanceOrchestrator::TaskLockName("retention"), other_options.worker_id, 30s));

  MaintenanceOrchestrator orchestrator(components, redrive::factory::MaintenanceOptionsFrom(config));
  const auto              results = orchestrator.RunCycle();
  assert(!Task(results, "retention").ran);
  assert(Task(results, "reclaim").ran);
  assert(Task(results, "reclaim-counter-gc").ran);
}

} // namespace

int main() {
  TestStalledWorkIsDeadLetteredArchivedAndReplayed();
  TestSecondWorkerSkipsLockedTasks();
  std::cout << "redrive_integration_recovery_end_to_end: pass\n";
  return 0;
}
