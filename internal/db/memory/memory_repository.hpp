#pragma once

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace redrive::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Every transaction works on a private copy of the committed state and
  publishes it on Commit() if no other writer committed in between.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result CreateStream(Transaction&, model::StreamRecord&) override;
  std::optional<model::StreamRecord> GetStreamByName(Transaction&, const std::string& name) override;
  Result AppendStreamEntries(Transaction&, uint64_t stream_id,
                             std::vector<model::StreamEntryRecord>& entries) override;
  std::vector<model::StreamEntryRecord> ReadStreamEntries(Transaction&, uint64_t stream_id, uint64_t start_offset,
                                                          std::optional<uint64_t> max_entries) override;
  std::optional<model::StreamEntryRecord> GetStreamEntry(Transaction&, uint64_t stream_id, uint64_t offset) override;
  std::optional<model::StreamEntryRecord> FindStreamEntryByDedupeKey(Transaction&, uint64_t stream_id,
                                                                     const std::string& dedupe_key) override;
  uint64_t CountStreamEntries(Transaction&, uint64_t stream_id) override;
  Result DeleteStreamEntry(Transaction&, uint64_t stream_id, uint64_t offset) override;
  Result TrimStreamEntriesToMaxCount(Transaction&, uint64_t stream_id, uint64_t max_entries) override;

  Result CreateConsumerGroup(Transaction&, const model::ConsumerGroupRecord&) override;
  std::optional<model::ConsumerGroupRecord> GetConsumerGroup(Transaction&, uint64_t stream_id,
                                                             const std::string& group_name) override;
  Result AdvanceConsumerGroup(Transaction&, uint64_t stream_id, const std::string& group_name,
                              uint64_t last_delivered_offset) override;
  Result InsertPendingEntry(Transaction&, const model::PendingEntryRecord&) override;
  std::optional<model::PendingEntryRecord> GetPendingEntry(Transaction&, uint64_t stream_id,
                                                           const std::string& group_name, uint64_t offset) override;
  std::vector<model::PendingEntryRecord> ListPendingEntries(Transaction&, uint64_t stream_id,
                                                            const std::string& group_name, uint64_t limit) override;
  uint64_t CountPendingEntries(Transaction&, uint64_t stream_id, const std::string& group_name) override;
  Result ClaimPendingEntry(Transaction&, uint64_t stream_id, const std::string& group_name, uint64_t offset,
                           const std::string& consumer, uint64_t min_idle_ms, uint64_t now_ms) override;
  Result DeletePendingEntry(Transaction&, uint64_t stream_id, const std::string& group_name, uint64_t offset) override;

  std::optional<model::ReclaimAttemptRecord> GetReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t offset) override;
  Result IncrementReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t offset, uint64_t now_ms) override;
  Result DeleteReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t offset) override;
  std::vector<model::ReclaimAttemptRecord> ListReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t limit) override;

  Result InsertReplayLogIfAbsent(Transaction&, const model::ReplayLogRecord&) override;
  std::optional<model::ReplayLogRecord> GetReplayLog(Transaction&, const std::string& original_stream,
                                                    const std::string& original_msg_id) override;
  Result SetReplayLogNewMessageId(Transaction&, const std::string& original_stream, const std::string& original_msg_id,
                                  const std::string& new_msg_id) override;

  Result UpsertDeadLetterArchive(Transaction&, const model::DeadLetterArchiveRecord&) override;
  std::optional<model::DeadLetterArchiveRecord> GetDeadLetterArchive(Transaction&, const std::string& dl_stream,
                                                                    const std::string& dl_msg_id) override;

  Result AcquireLock(Transaction&, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                     uint64_t expires_at_ms) override;
  Result ExtendLock(Transaction&, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                    uint64_t expires_at_ms) override;
  Result ReleaseLock(Transaction&, const std::string& lock_name, const std::string& holder_id) override;
  Result DeleteExpiredLocks(Transaction&, uint64_t now_ms) override;
  std::optional<model::LockRecord> GetLock(Transaction&, const std::string& lock_name) override;

  Result InsertOutbox(Transaction&, model::OutboxRecord& record) override;
  std::optional<model::OutboxRecord> GetOutbox(Transaction&, uint64_t id) override;
  std::vector<model::OutboxRecord> ClaimOutbox(Transaction&, const std::string& processor_id, uint64_t batch_size,
                                               uint64_t now_ms, uint64_t stale_claim_before_ms) override;
  Result MarkOutboxProcessed(Transaction&, uint64_t id, const std::string& processor_id, uint64_t now_ms) override;
  Result FailOutbox(Transaction&, uint64_t id, const std::string& processor_id, uint32_t expected_retry_count,
                    uint64_t process_after_ms, const std::string& error) override;

  uint64_t CountExpired(Transaction&, RetentionTable table, uint64_t cutoff_ms) override;
  Result DeleteExpired(Transaction&, RetentionTable table, uint64_t cutoff_ms) override;

private:
  friend class MemoryTransaction;

  using GroupKey     = std::pair<uint64_t, std::string>;
  using PendingKey   = std::tuple<uint64_t, std::string, uint64_t>;
  using EntryKey     = std::pair<uint64_t, uint64_t>;
  using StreamMsgKey = std::pair<std::string, std::string>; // (stream name, message id)

  struct State {
    std::map<uint64_t, model::StreamRecord> streams;
    std::map<std::string, uint64_t> stream_name_to_id;
    std::map<uint64_t, std::map<uint64_t, model::StreamEntryRecord>> stream_entries;
    std::map<uint64_t, uint64_t> next_stream_offset;
    uint64_t next_stream_id = 1;

    std::map<GroupKey, model::ConsumerGroupRecord> consumer_groups;
    std::map<PendingKey, model::PendingEntryRecord> pending;
    std::map<EntryKey, model::ReclaimAttemptRecord> reclaim_attempts;

    std::map<StreamMsgKey, model::ReplayLogRecord> replay_log;
    std::map<StreamMsgKey, model::DeadLetterArchiveRecord> archive;
    std::map<std::string, model::LockRecord> locks;

    std::map<uint64_t, model::OutboxRecord> outbox;
    uint64_t next_outbox_id = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
