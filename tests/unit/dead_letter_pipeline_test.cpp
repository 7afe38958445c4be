#include "internal/deadletter/dead_letter_pipeline.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/reclaim_scheduler.hpp"
#include "tests/support/hooked_repository.hpp"

namespace {

using redrive::db::memory::MemoryRepository;
using redrive::deadletter::DeadLetterOptions;
using redrive::deadletter::DeadLetterPipeline;
using redrive::deadletter::ReplayAllOptions;
using redrive::deadletter::ReplayOptions;
using redrive::queue::DurableQueue;
using redrive::queue::FieldMap;
using redrive::queue::MessageId;
using redrive::queue::QueueOptions;
using redrive::stream::StreamStore;
using redrive::testing::HookedRepository;

constexpr const char* kStream     = "test:work";
constexpr const char* kDeadLetter = "test:work:dead-letter";

struct Fixture {
  std::shared_ptr<HookedRepository>   repository = std::make_shared<HookedRepository>(std::make_shared<MemoryRepository>());
  std::shared_ptr<StreamStore>        store      = std::make_shared<StreamStore>(repository);
  std::shared_ptr<DurableQueue>       queue;
  std::shared_ptr<DeadLetterPipeline> pipeline;

  Fixture() {
    QueueOptions options;
    options.stream_key        = kStream;
    options.consumer_group    = "test-workers";
    options.consumer_name     = "c1";
    options.max_stream_length = 0;
    queue                     = std::make_shared<DurableQueue>(store, options);
    assert(queue->EnsureConsumerGroup());

    DeadLetterOptions dl_options;
    dl_options.stream_key  = kDeadLetter;
    dl_options.replayed_by = "tester";
    pipeline               = std::make_shared<DeadLetterPipeline>(queue, repository, dl_options);
  }

  // Enqueues, consumes and dead-letters one message; returns {original id, dead-letter id}.
  std::pair<MessageId, MessageId> DeadLetterOne(const std::string& candidate) {
    const auto id = queue->Enqueue(FieldMap{{"candidate_id", candidate}, {"idempotency_key", "idem-" + candidate}}, 0);
    assert(id.has_value());
    const auto batch = queue->ConsumeBatch(100, std::chrono::milliseconds(0));
    assert(!batch.empty());
    assert(pipeline->MoveToDeadLetter(*id, *queue->Read(*id), "handler_failed"));
    const auto entry = pipeline->Find(*id);
    assert(entry.has_value());
    return {*id, entry->id};
  }

  std::optional<redrive::db::model::ReplayLogRecord> Ledger(const MessageId& original_id) {
    auto tx     = repository->Begin();
    auto record = repository->GetReplayLog(*tx, kStream, original_id);
    tx->Commit();
    return record;
  }
};

void TestMoveToDeadLetterWritesThenAcks() {
  Fixture f;
  const auto [id, dl_id] = f.DeadLetterOne("cand-1");

  assert(f.queue->Pending(10).empty());
  assert(f.pipeline->Count() == 1);

  const auto entry = f.store->Get(kDeadLetter, dl_id);
  assert(entry.has_value());
  assert(entry->fields.at("original_msg_id") == id);
  assert(entry->fields.at("original_stream") == kStream);
  assert(entry->fields.at("reason") == "handler_failed");
  assert(entry->fields.at("consumer") == "c1");
  assert(!entry->fields.at("dead_lettered_at").empty());
  assert(entry->fields.at("orig_candidate_id") == "cand-1");
  assert(entry->fields.at("orig_idempotency_key") == "idem-cand-1");
}

void TestFailedDeadLetterWriteKeepsMessagePending() {
  Fixture f;
  const auto id = f.queue->Enqueue(FieldMap{{"candidate_id", "cand-1"}}, 0);
  assert(id.has_value());
  assert(f.queue->ConsumeBatch(1, std::chrono::milliseconds(0)).size() == 1);

  f.repository->fail_op = [](std::string_view op) { return op == "AppendStreamEntries"; };
  assert(!f.pipeline->MoveToDeadLetter(*id, *f.queue->Read(*id), "handler_failed"));
  f.repository->fail_op = nullptr;

  // Never acked before the dead-letter write succeeded.
  assert(f.queue->Pending(10).size() == 1);
  assert(f.pipeline->Count() == 0);
}

void TestFailedAckStillSucceedsAndHealsOnNextPass() {
  Fixture f;
  const auto id = f.queue->Enqueue(FieldMap{{"candidate_id", "cand-1"}}, 0);
  assert(id.has_value());
  assert(f.queue->ConsumeBatch(1, std::chrono::milliseconds(0)).size() == 1);

  // Crash between dead-letter write and ack.
  f.repository->fail_op = [](std::string_view op) { return op == "DeletePendingEntry"; };
  assert(f.pipeline->MoveToDeadLetter(*id, *f.queue->Read(*id), "handler_failed"));
  f.repository->fail_op = nullptr;

  assert(f.pipeline->Count() == 1);
  assert(f.queue->Pending(10).size() == 1);

  // Next reclaim pass hits the ceiling again; the duplicate write is absorbed.
  redrive::queue::ReclaimScheduler scheduler(f.queue, f.pipeline, {});
  redrive::queue::ReclaimOptions   options;
  options.idle_threshold_ms               = 0;
  options.max_reclaims_before_dead_letter = 1;
  options.use_backoff                     = false;

  const auto summary = scheduler.ReclaimStalled(options);
  assert(summary.dead_lettered == 1);
  assert(f.pipeline->Count() == 1);
  assert(f.queue->Pending(10).empty());
}

void TestReplayReinjectsAndDeletes() {
  Fixture f;
  const auto [id, dl_id] = f.DeadLetterOne("cand-1");
  const auto before      = f.queue->Info().length;

  const auto new_id = f.pipeline->Replay(dl_id);
  assert(new_id.has_value());
  assert(*new_id != id);
  assert(f.queue->Info().length == before + 1);
  assert(f.pipeline->Count() == 0);

  const auto replayed = f.queue->Read(*new_id);
  assert(replayed.has_value());
  assert(replayed->at("candidate_id") == "cand-1");
  assert(replayed->at("idempotency_key") == "idem-cand-1");
  assert(replayed->at("replayed_from_dl") == dl_id);
  assert(!replayed->at("replayed_at").empty());
  assert(!replayed->contains("reason"));

  const auto ledger = f.Ledger(id);
  assert(ledger.has_value());
  assert(ledger->dl_msg_id == dl_id);
  assert(ledger->new_msg_id == *new_id);
  assert(ledger->candidate_id == std::optional<std::string>("cand-1"));
  assert(ledger->idempotency_key == std::optional<std::string>("idem-cand-1"));
  assert(ledger->replayed_by == "tester");
  assert(ledger->status == redrive::db::model::kReplayStatusReplayed);

  // Entry is gone: nothing left to replay.
  assert(!f.pipeline->Replay(dl_id).has_value());
}

void TestSequentialReplayIsIdempotent() {
  Fixture f;
  const auto [id, dl_id] = f.DeadLetterOne("cand-1");
  const auto before      = f.queue->Info().length;

  // Replay succeeds but the dead-letter delete fails, so the entry is still there.
  f.repository->fail_op = [](std::string_view op) { return op == "DeleteStreamEntry"; };
  assert(f.pipeline->Replay(dl_id).has_value());
  f.repository->fail_op = nullptr;
  assert(f.pipeline->Count() == 1);

  assert(!f.pipeline->Replay(dl_id).has_value());
  // The ledger insert alone also stops a second injection.
  assert(!f.pipeline->Replay(dl_id, ReplayOptions{false, false}).has_value());

  assert(f.queue->Info().length == before + 1);
  assert(f.Ledger(id).has_value());
}

void TestConcurrentReplayInjectsOnce() {
  for (const bool check_idempotency : {true, false}) {
    Fixture f;
    const auto [id, dl_id] = f.DeadLetterOne("cand-1");
    const auto before      = f.queue->Info().length;

    std::atomic<int>         successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&, dl_id = dl_id] {
        if (f.pipeline->Replay(dl_id, ReplayOptions{check_idempotency, false}).has_value()) {
          ++successes;
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }

    assert(successes == 1);
    assert(f.queue->Info().length == before + 1);
    assert(f.Ledger(id).has_value());
  }
}

void TestAlreadyProcessedIsRecordedNoOp() {
  Fixture f;
  const auto [id, dl_id] = f.DeadLetterOne("cand-1");
  const auto before      = f.queue->Info().length;

  FieldMap seen;
  f.pipeline->SetProcessedStateCheck([&](const FieldMap& fields) {
    seen = fields;
    return true;
  });

  assert(!f.pipeline->Replay(dl_id).has_value());
  assert(seen.at("candidate_id") == "cand-1");
  assert(f.queue->Info().length == before);

  const auto ledger = f.Ledger(id);
  assert(ledger.has_value());
  assert(ledger->status == redrive::db::model::kReplayStatusAlreadyProcessed);
  assert(!ledger->new_msg_id.has_value());

  // Skipping the processed-state check does not bypass the ledger.
  assert(!f.pipeline->Replay(dl_id, ReplayOptions{true, false}).has_value());
  assert(f.queue->Info().length == before);
}

void TestFailingProcessedCheckDoesNotBlockReplay() {
  Fixture f;
  const auto [id, dl_id] = f.DeadLetterOne("cand-1");
  f.pipeline->SetProcessedStateCheck([](const FieldMap&) -> bool { throw std::runtime_error("business store down"); });

  assert(f.pipeline->Replay(dl_id).has_value());
  assert(f.Ledger(id).has_value());
}

void TestReplayAllPagesFromOldest() {
  Fixture f;
  std::vector<MessageId> originals;
  for (int i = 0; i < 7; ++i) {
    originals.push_back(f.DeadLetterOne("cand-" + std::to_string(i)).first);
  }

  ReplayAllOptions options;
  options.batch_size  = 3;
  options.max_replays = 4;
  auto summary        = f.pipeline->ReplayAll(options);
  assert(summary.replayed == 4);
  assert(summary.errors == 0);
  assert(summary.completed);
  assert(f.pipeline->Count() == 3);
  // Oldest first.
  assert(f.Ledger(originals[0]).has_value());
  assert(f.Ledger(originals[3]).has_value());
  assert(!f.Ledger(originals[4]).has_value());

  options.max_replays = 100;
  summary             = f.pipeline->ReplayAll(options);
  assert(summary.replayed == 3);
  assert(f.pipeline->Count() == 0);
}

void TestReplayAllCountsSkips() {
  Fixture f;
  f.DeadLetterOne("cand-0");
  const auto [id, dl_id] = f.DeadLetterOne("cand-1");
  f.DeadLetterOne("cand-2");

  // Leave one already-replayed entry behind.
  f.repository->fail_op = [](std::string_view op) { return op == "DeleteStreamEntry"; };
  assert(f.pipeline->Replay(dl_id).has_value());
  f.repository->fail_op = nullptr;

  ReplayAllOptions options;
  options.batch_size = 2;
  const auto summary = f.pipeline->ReplayAll(options);
  assert(summary.replayed == 2);
  assert(summary.skipped == 1);
  assert(summary.errors == 0);
}

void TestReplayAllStopsAtDeadline() {
  Fixture f;
  f.DeadLetterOne("cand-0");
  f.DeadLetterOne("cand-1");

  ReplayAllOptions options;
  options.deadline   = redrive::util::Deadline::After(std::chrono::milliseconds(0));
  const auto summary = f.pipeline->ReplayAll(options);
  assert(!summary.completed);
  assert(summary.replayed == 0);
  assert(summary.errors == 0);
  assert(f.pipeline->Count() == 2);
}

void TestReconstructOriginalFields() {
  const FieldMap dl_fields = {{"original_msg_id", "5"}, {"reason", "x"}, {"orig_candidate_id", "c"}, {"orig_priority", "1"}, {"orig_", "bare"}};
  const auto     fields    = redrive::deadletter::ReconstructOriginalFields(dl_fields);
  assert(fields.size() == 2);
  assert(fields.at("candidate_id") == "c");
  assert(fields.at("priority") == "1");
}

// Two queues on one repository both start their ids at 1; replaying one
// lane's dead letter must not mark the other lane's as already replayed.
void TestReplayLedgerIsPerStream() {
  auto repository = std::make_shared<MemoryRepository>();
  auto store      = std::make_shared<StreamStore>(repository);

  std::vector<std::shared_ptr<DurableQueue>>       queues;
  std::vector<std::shared_ptr<DeadLetterPipeline>> pipelines;
  std::vector<MessageId>                           dl_ids;
  for (const std::string lane : {"work:a", "work:b"}) {
    QueueOptions options;
    options.stream_key     = lane;
    options.consumer_group = "workers";
    options.consumer_name  = "c1";
    auto queue             = std::make_shared<DurableQueue>(store, options);
    assert(queue->EnsureConsumerGroup());

    DeadLetterOptions dl_options;
    dl_options.stream_key  = lane + ":dead-letter";
    dl_options.replayed_by = "tester";
    auto pipeline          = std::make_shared<DeadLetterPipeline>(queue, repository, dl_options);

    const auto id = queue->Enqueue(FieldMap{{"candidate_id", lane}}, 0);
    assert(id == std::optional<MessageId>("1"));
    assert(!queue->ConsumeBatch(10, std::chrono::milliseconds(0)).empty());
    assert(pipeline->MoveToDeadLetter(*id, *queue->Read(*id), "handler_failed"));
    dl_ids.push_back(pipeline->Find(*id)->id);

    queues.push_back(queue);
    pipelines.push_back(pipeline);
  }

  for (std::size_t i = 0; i < pipelines.size(); ++i) {
    const auto new_id = pipelines[i]->Replay(dl_ids[i], ReplayOptions{});
    assert(new_id.has_value());
    assert(queues[i]->Read(*new_id)->at("candidate_id") == (i == 0 ? "work:a" : "work:b"));
    assert(pipelines[i]->Count() == 0);
  }

  auto       tx = repository->Begin();
  const auto a  = repository->GetReplayLog(*tx, "work:a", "1");
  const auto b  = repository->GetReplayLog(*tx, "work:b", "1");
  tx->Commit();
  assert(a.has_value() && b.has_value());
  assert(a->new_msg_id.has_value() && b->new_msg_id.has_value());
}

} // namespace

int main() {
  TestMoveToDeadLetterWritesThenAcks();
  TestFailedDeadLetterWriteKeepsMessagePending();
  TestFailedAckStillSucceedsAndHealsOnNextPass();
  TestReplayReinjectsAndDeletes();
  TestSequentialReplayIsIdempotent();
  TestConcurrentReplayInjectsOnce();
  TestAlreadyProcessedIsRecordedNoOp();
  TestFailingProcessedCheckDoesNotBlockReplay();
  TestReplayAllPagesFromOldest();
  TestReplayAllCountsSkips();
  TestReplayAllStopsAtDeadline();
  TestReconstructOriginalFields();
  TestReplayLedgerIsPerStream();

  std::cout << "redrive_unit_dead_letter_pipeline: pass\n";
  return 0;
}
