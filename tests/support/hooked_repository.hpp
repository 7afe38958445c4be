#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace redrive::testing {

/*
  Repository decorator for fault injection.

  Every call is forwarded to the wrapped repository unless a hook asks
  for a failure, in which case the write reports IOError without
  touching the store.
*/
class HookedRepository final : public db::Repository {
 public:
  explicit HookedRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  // Called with the method name of every write; true injects a failure.
  std::function<bool(std::string_view op)> fail_op;
  // Selective failure for dead-letter archive upserts.
  std::function<bool(const db::model::DeadLetterArchiveRecord&)> fail_archive;

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result CreateStream(db::Transaction& tx, db::model::StreamRecord& r) override {
    return Guard("CreateStream", [&] { return inner_->CreateStream(tx, r); });
  }
  std::optional<db::model::StreamRecord> GetStreamByName(db::Transaction& tx, const std::string& name) override {
    return inner_->GetStreamByName(tx, name);
  }
  db::Result AppendStreamEntries(db::Transaction& tx, uint64_t stream_id, std::vector<db::model::StreamEntryRecord>& entries) override {
    return Guard("AppendStreamEntries", [&] { return inner_->AppendStreamEntries(tx, stream_id, entries); });
  }
  std::vector<db::model::StreamEntryRecord> ReadStreamEntries(db::Transaction& tx, uint64_t stream_id, uint64_t start_offset,
                                                              std::optional<uint64_t> max_entries) override {
    return inner_->ReadStreamEntries(tx, stream_id, start_offset, max_entries);
  }
  std::optional<db::model::StreamEntryRecord> GetStreamEntry(db::Transaction& tx, uint64_t stream_id, uint64_t offset) override {
    return inner_->GetStreamEntry(tx, stream_id, offset);
  }
  std::optional<db::model::StreamEntryRecord> FindStreamEntryByDedupeKey(db::Transaction& tx, uint64_t stream_id,
                                                                         const std::string& dedupe_key) override {
    return inner_->FindStreamEntryByDedupeKey(tx, stream_id, dedupe_key);
  }
  uint64_t CountStreamEntries(db::Transaction& tx, uint64_t stream_id) override {
    return inner_->CountStreamEntries(tx, stream_id);
  }
  db::Result DeleteStreamEntry(db::Transaction& tx, uint64_t stream_id, uint64_t offset) override {
    return Guard("DeleteStreamEntry", [&] { return inner_->DeleteStreamEntry(tx, stream_id, offset); });
  }
  db::Result TrimStreamEntriesToMaxCount(db::Transaction& tx, uint64_t stream_id, uint64_t max_entries) override {
    return Guard("TrimStreamEntriesToMaxCount", [&] { return inner_->TrimStreamEntriesToMaxCount(tx, stream_id, max_entries); });
  }

  db::Result CreateConsumerGroup(db::Transaction& tx, const db::model::ConsumerGroupRecord& r) override {
    return Guard("CreateConsumerGroup", [&] { return inner_->CreateConsumerGroup(tx, r); });
  }
  std::optional<db::model::ConsumerGroupRecord> GetConsumerGroup(db::Transaction& tx, uint64_t stream_id,
                                                                 const std::string& group_name) override {
    return inner_->GetConsumerGroup(tx, stream_id, group_name);
  }
  db::Result AdvanceConsumerGroup(db::Transaction& tx, uint64_t stream_id, const std::string& group_name,
                                  uint64_t last_delivered_offset) override {
    return Guard("AdvanceConsumerGroup", [&] { return inner_->AdvanceConsumerGroup(tx, stream_id, group_name, last_delivered_offset); });
  }
  db::Result InsertPendingEntry(db::Transaction& tx, const db::model::PendingEntryRecord& r) override {
    return Guard("InsertPendingEntry", [&] { return inner_->InsertPendingEntry(tx, r); });
  }
  std::optional<db::model::PendingEntryRecord> GetPendingEntry(db::Transaction& tx, uint64_t stream_id, const std::string& group_name,
                                                               uint64_t offset) override {
    return inner_->GetPendingEntry(tx, stream_id, group_name, offset);
  }
  std::vector<db::model::PendingEntryRecord> ListPendingEntries(db::Transaction& tx, uint64_t stream_id, const std::string& group_name,
                                                                uint64_t limit) override {
    return inner_->ListPendingEntries(tx, stream_id, group_name, limit);
  }
  uint64_t CountPendingEntries(db::Transaction& tx, uint64_t stream_id, const std::string& group_name) override {
    return inner_->CountPendingEntries(tx, stream_id, group_name);
  }
  db::Result ClaimPendingEntry(db::Transaction& tx, uint64_t stream_id, const std::string& group_name, uint64_t offset,
                               const std::string& consumer, uint64_t min_idle_ms, uint64_t now_ms) override {
    return Guard("ClaimPendingEntry",
                 [&] { return inner_->ClaimPendingEntry(tx, stream_id, group_name, offset, consumer, min_idle_ms, now_ms); });
  }
  db::Result DeletePendingEntry(db::Transaction& tx, uint64_t stream_id, const std::string& group_name, uint64_t offset) override {
    return Guard("DeletePendingEntry", [&] { return inner_->DeletePendingEntry(tx, stream_id, group_name, offset); });
  }

  std::optional<db::model::ReclaimAttemptRecord> GetReclaimAttempts(db::Transaction& tx, uint64_t stream_id, uint64_t offset) override {
    return inner_->GetReclaimAttempts(tx, stream_id, offset);
  }
  db::Result IncrementReclaimAttempts(db::Transaction& tx, uint64_t stream_id, uint64_t offset, uint64_t now_ms) override {
    return Guard("IncrementReclaimAttempts", [&] { return inner_->IncrementReclaimAttempts(tx, stream_id, offset, now_ms); });
  }
  db::Result DeleteReclaimAttempts(db::Transaction& tx, uint64_t stream_id, uint64_t offset) override {
    return Guard("DeleteReclaimAttempts", [&] { return inner_->DeleteReclaimAttempts(tx, stream_id, offset); });
  }
  std::vector<db::model::ReclaimAttemptRecord> ListReclaimAttempts(db::Transaction& tx, uint64_t stream_id, uint64_t limit) override {
    return inner_->ListReclaimAttempts(tx, stream_id, limit);
  }

  db::Result InsertReplayLogIfAbsent(db::Transaction& tx, const db::model::ReplayLogRecord& r) override {
    return Guard("InsertReplayLogIfAbsent", [&] { return inner_->InsertReplayLogIfAbsent(tx, r); });
  }
  std::optional<db::model::ReplayLogRecord> GetReplayLog(db::Transaction& tx, const std::string& original_stream,
                                                        const std::string& original_msg_id) override {
    return inner_->GetReplayLog(tx, original_stream, original_msg_id);
  }
  db::Result SetReplayLogNewMessageId(db::Transaction& tx, const std::string& original_stream, const std::string& original_msg_id,
                                      const std::string& new_msg_id) override {
    return Guard("SetReplayLogNewMessageId",
                 [&] { return inner_->SetReplayLogNewMessageId(tx, original_stream, original_msg_id, new_msg_id); });
  }

  db::Result UpsertDeadLetterArchive(db::Transaction& tx, const db::model::DeadLetterArchiveRecord& r) override {
    if (fail_archive && fail_archive(r)) {
      return db::Result::Err(db::ErrorCode::IOError, "injected archive failure");
    }
    return Guard("UpsertDeadLetterArchive", [&] { return inner_->UpsertDeadLetterArchive(tx, r); });
  }
  std::optional<db::model::DeadLetterArchiveRecord> GetDeadLetterArchive(db::Transaction& tx, const std::string& dl_stream,
                                                                        const std::string& dl_msg_id) override {
    return inner_->GetDeadLetterArchive(tx, dl_stream, dl_msg_id);
  }

  db::Result AcquireLock(db::Transaction& tx, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                         uint64_t expires_at_ms) override {
    return Guard("AcquireLock", [&] { return inner_->AcquireLock(tx, lock_name, holder_id, now_ms, expires_at_ms); });
  }
  db::Result ExtendLock(db::Transaction& tx, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                        uint64_t expires_at_ms) override {
    return Guard("ExtendLock", [&] { return inner_->ExtendLock(tx, lock_name, holder_id, now_ms, expires_at_ms); });
  }
  db::Result ReleaseLock(db::Transaction& tx, const std::string& lock_name, const std::string& holder_id) override {
    return Guard("ReleaseLock", [&] { return inner_->ReleaseLock(tx, lock_name, holder_id); });
  }
  db::Result DeleteExpiredLocks(db::Transaction& tx, uint64_t now_ms) override {
    return Guard("DeleteExpiredLocks", [&] { return inner_->DeleteExpiredLocks(tx, now_ms); });
  }
  std::optional<db::model::LockRecord> GetLock(db::Transaction& tx, const std::string& lock_name) override {
    return inner_->GetLock(tx, lock_name);
  }

  db::Result InsertOutbox(db::Transaction& tx, db::model::OutboxRecord& record) override {
    return Guard("InsertOutbox", [&] { return inner_->InsertOutbox(tx, record); });
  }
  std::optional<db::model::OutboxRecord> GetOutbox(db::Transaction& tx, uint64_t id) override {
    return inner_->GetOutbox(tx, id);
  }
  std::vector<db::model::OutboxRecord> ClaimOutbox(db::Transaction& tx, const std::string& processor_id, uint64_t batch_size,
                                                   uint64_t now_ms, uint64_t stale_claim_before_ms) override {
    return inner_->ClaimOutbox(tx, processor_id, batch_size, now_ms, stale_claim_before_ms);
  }
  db::Result MarkOutboxProcessed(db::Transaction& tx, uint64_t id, const std::string& processor_id, uint64_t now_ms) override {
    return Guard("MarkOutboxProcessed", [&] { return inner_->MarkOutboxProcessed(tx, id, processor_id, now_ms); });
  }
  db::Result FailOutbox(db::Transaction& tx, uint64_t id, const std::string& processor_id, uint32_t expected_retry_count,
                        uint64_t process_after_ms, const std::string& error) override {
    return Guard("FailOutbox", [&] { return inner_->FailOutbox(tx, id, processor_id, expected_retry_count, process_after_ms, error); });
  }

  uint64_t CountExpired(db::Transaction& tx, db::RetentionTable table, uint64_t cutoff_ms) override {
    return inner_->CountExpired(tx, table, cutoff_ms);
  }
  db::Result DeleteExpired(db::Transaction& tx, db::RetentionTable table, uint64_t cutoff_ms) override {
    return Guard("DeleteExpired", [&] { return inner_->DeleteExpired(tx, table, cutoff_ms); });
  }

 private:
  template <typename Fn>
  db::Result Guard(std::string_view op, Fn&& fn) {
    if (fail_op && fail_op(op)) {
      return db::Result::Err(db::ErrorCode::IOError, "injected failure: " + std::string(op));
    }
    return fn();
  }

  std::shared_ptr<db::Repository> inner_;
};

} // namespace redrive::testing
