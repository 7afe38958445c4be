#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/consumer_group_record.hpp"
#include "internal/db/model/dead_letter_archive_record.hpp"
#include "internal/db/model/lock_record.hpp"
#include "internal/db/model/outbox_record.hpp"
#include "internal/db/model/pending_entry_record.hpp"
#include "internal/db/model/reclaim_attempt_record.hpp"
#include "internal/db/model/replay_log_record.hpp"
#include "internal/db/model/stream_entry_record.hpp"
#include "internal/db/model/stream_record.hpp"

namespace redrive::db {

// Tables with an age-based retention window.
enum class RetentionTable {
  DeadLetterArchive, // archived_at
  ReplayLog,         // replayed_at
  ProcessedOutbox    // processed_at, unprocessed rows never qualify
};

const char* ToString(RetentionTable table);

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Conditional writes (Claim*, AcquireLock, ExtendLock, ReleaseLock,
    FailOutbox, Insert*IfAbsent) are single compare-and-set statements;
    they report success through Result::affected
  - "Already exists" is a result code, never an exception

  The DB is the source of truth for:
    streams and consumer groups
    pending entries and reclaim counters
    replay ledger, dead-letter archive
    locks, outbox
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  virtual Result CreateStream(Transaction&, model::StreamRecord&) = 0;

  virtual std::optional<model::StreamRecord> GetStreamByName(Transaction&, const std::string& name) = 0;

  // Appends entries while assigning strictly increasing offsets for the stream.
  // A duplicate dedupe_key yields AlreadyExists and nothing is appended.
  virtual Result AppendStreamEntries(Transaction&, uint64_t stream_id, std::vector<model::StreamEntryRecord>& entries) = 0;

  // Entries with offset >= start_offset, oldest first.
  virtual std::vector<model::StreamEntryRecord> ReadStreamEntries(Transaction&, uint64_t stream_id, uint64_t start_offset,
                                                                  std::optional<uint64_t> max_entries) = 0;

  virtual std::optional<model::StreamEntryRecord> GetStreamEntry(Transaction&, uint64_t stream_id, uint64_t offset) = 0;

  virtual std::optional<model::StreamEntryRecord> FindStreamEntryByDedupeKey(Transaction&, uint64_t stream_id,
                                                                             const std::string& dedupe_key) = 0;

  virtual uint64_t CountStreamEntries(Transaction&, uint64_t stream_id) = 0;

  virtual Result DeleteStreamEntry(Transaction&, uint64_t stream_id, uint64_t offset) = 0;

  // Deletes the oldest entries until at most max_entries remain.
  virtual Result TrimStreamEntriesToMaxCount(Transaction&, uint64_t stream_id, uint64_t max_entries) = 0;

  // ---------------------------------------------------------------------
  // Consumer groups / pending-entry list
  // ---------------------------------------------------------------------

  virtual Result CreateConsumerGroup(Transaction&, const model::ConsumerGroupRecord&) = 0;

  virtual std::optional<model::ConsumerGroupRecord> GetConsumerGroup(Transaction&, uint64_t stream_id, const std::string& group_name) = 0;

  virtual Result AdvanceConsumerGroup(Transaction&, uint64_t stream_id, const std::string& group_name, uint64_t last_delivered_offset) = 0;

  virtual Result InsertPendingEntry(Transaction&, const model::PendingEntryRecord&) = 0;

  virtual std::optional<model::PendingEntryRecord> GetPendingEntry(Transaction&, uint64_t stream_id, const std::string& group_name,
                                                                   uint64_t offset) = 0;

  virtual std::vector<model::PendingEntryRecord> ListPendingEntries(Transaction&, uint64_t stream_id, const std::string& group_name,
                                                                    uint64_t limit) = 0;

  virtual uint64_t CountPendingEntries(Transaction&, uint64_t stream_id, const std::string& group_name) = 0;

  /*
    Transfers ownership of a pending entry to `consumer` if it has been idle
    for at least min_idle_ms. On success delivered_at becomes now and
    delivery_count is incremented. affected == 0 means another claimer won
    or the entry is gone.
  */
  virtual Result ClaimPendingEntry(Transaction&, uint64_t stream_id, const std::string& group_name, uint64_t offset,
                                   const std::string& consumer, uint64_t min_idle_ms, uint64_t now_ms) = 0;

  virtual Result DeletePendingEntry(Transaction&, uint64_t stream_id, const std::string& group_name, uint64_t offset) = 0;

  // ---------------------------------------------------------------------
  // Reclaim attempt counters
  // ---------------------------------------------------------------------

  virtual std::optional<model::ReclaimAttemptRecord> GetReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t offset) = 0;

  virtual Result IncrementReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t offset, uint64_t now_ms) = 0;

  virtual Result DeleteReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t offset) = 0;

  virtual std::vector<model::ReclaimAttemptRecord> ListReclaimAttempts(Transaction&, uint64_t stream_id, uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Replay ledger
  // ---------------------------------------------------------------------

  // AlreadyExists when a record for (original_stream, original_msg_id) is present.
  virtual Result InsertReplayLogIfAbsent(Transaction&, const model::ReplayLogRecord&) = 0;

  virtual std::optional<model::ReplayLogRecord> GetReplayLog(Transaction&, const std::string& original_stream,
                                                            const std::string& original_msg_id) = 0;

  // Fills new_msg_id once; affected == 0 if it was already set.
  virtual Result SetReplayLogNewMessageId(Transaction&, const std::string& original_stream, const std::string& original_msg_id,
                                          const std::string& new_msg_id) = 0;

  // ---------------------------------------------------------------------
  // Dead-letter archive
  // ---------------------------------------------------------------------

  // Upsert keyed by (dl_stream, dl_msg_id); an existing row only has archived_at refreshed.
  virtual Result UpsertDeadLetterArchive(Transaction&, const model::DeadLetterArchiveRecord&) = 0;

  virtual std::optional<model::DeadLetterArchiveRecord> GetDeadLetterArchive(Transaction&, const std::string& dl_stream,
                                                                            const std::string& dl_msg_id) = 0;

  // ---------------------------------------------------------------------
  // Distributed locks
  // ---------------------------------------------------------------------

  // Inserts, or takes over a row that is expired or already held by holder_id.
  virtual Result AcquireLock(Transaction&, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                             uint64_t expires_at_ms) = 0;

  // Only the current, unexpired holder may extend.
  virtual Result ExtendLock(Transaction&, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                            uint64_t expires_at_ms) = 0;

  virtual Result ReleaseLock(Transaction&, const std::string& lock_name, const std::string& holder_id) = 0;

  virtual Result DeleteExpiredLocks(Transaction&, uint64_t now_ms) = 0;

  virtual std::optional<model::LockRecord> GetLock(Transaction&, const std::string& lock_name) = 0;

  // ---------------------------------------------------------------------
  // Outbox
  // ---------------------------------------------------------------------

  // Producer-side write; assigns record.id.
  virtual Result InsertOutbox(Transaction&, model::OutboxRecord& record) = 0;

  virtual std::optional<model::OutboxRecord> GetOutbox(Transaction&, uint64_t id) = 0;

  /*
    Marks up to batch_size due records as owned by processor_id and returns
    them, oldest first. Due: processed_at IS NULL, process_after <= now and
    either unclaimed or claimed at or before stale_claim_before_ms.
  */
  virtual std::vector<model::OutboxRecord> ClaimOutbox(Transaction&, const std::string& processor_id, uint64_t batch_size,
                                                       uint64_t now_ms, uint64_t stale_claim_before_ms) = 0;

  // Sets processed_at/processed_by and clears the claim; requires claimed_by == processor_id.
  virtual Result MarkOutboxProcessed(Transaction&, uint64_t id, const std::string& processor_id, uint64_t now_ms) = 0;

  /*
    retry_count = expected_retry_count + 1, process_after = process_after_ms,
    last_error = error, claim cleared. Requires claimed_by == processor_id and
    an unchanged retry_count.
  */
  virtual Result FailOutbox(Transaction&, uint64_t id, const std::string& processor_id, uint32_t expected_retry_count,
                            uint64_t process_after_ms, const std::string& error) = 0;

  // ---------------------------------------------------------------------
  // Retention
  // ---------------------------------------------------------------------

  virtual uint64_t CountExpired(Transaction&, RetentionTable table, uint64_t cutoff_ms) = 0;

  virtual Result DeleteExpired(Transaction&, RetentionTable table, uint64_t cutoff_ms) = 0;
};

} // namespace redrive::db
