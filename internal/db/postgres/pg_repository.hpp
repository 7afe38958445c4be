#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace redrive::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  template <typename Fn>
  static Result Guard(Fn&& fn);
  template <typename Fn>
  static auto Read(Fn&& fn) -> decltype(fn());
};

}
