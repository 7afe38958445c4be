#include "pg_repository.hpp"

#include <algorithm>
#include <string>

#include "internal/db/sql/field_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace redrive::db::postgres {

namespace {

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

constexpr const char* kEntryColumns = "stream_id,msg_offset,fields::text,dedupe_key,append_time";

model::StreamEntryRecord ReadEntry(const pqxx::row& row) {
  model::StreamEntryRecord e;
  e.stream_id      = row[0].as<uint64_t>();
  e.offset         = row[1].as<uint64_t>();
  e.fields         = sql::DecodeFields(row[2].c_str());
  e.dedupe_key     = Text(row[3]);
  e.append_time_ms = row[4].as<uint64_t>();
  return e;
}

constexpr const char* kPendingColumns = "stream_id,group_name,msg_offset,consumer,delivered_at,delivery_count";

model::PendingEntryRecord ReadPending(const pqxx::row& row) {
  model::PendingEntryRecord p;
  p.stream_id       = row[0].as<uint64_t>();
  p.group_name      = row[1].c_str();
  p.offset          = row[2].as<uint64_t>();
  p.consumer        = row[3].c_str();
  p.delivered_at_ms = row[4].as<uint64_t>();
  p.delivery_count  = row[5].as<uint64_t>();
  return p;
}

model::ReclaimAttemptRecord ReadReclaim(const pqxx::row& row) {
  model::ReclaimAttemptRecord r;
  r.stream_id     = row[0].as<uint64_t>();
  r.offset        = row[1].as<uint64_t>();
  r.attempts      = row[2].as<uint64_t>();
  r.updated_at_ms = row[3].as<uint64_t>();
  return r;
}

constexpr const char* kOutboxColumns =
    "id,aggregate_type,aggregate_id,event_kind,payload::text,created_at,processed_at,processed_by,retry_count,process_after,"
    "claimed_by,claimed_at,last_error";

model::OutboxRecord ReadOutbox(const pqxx::row& row) {
  model::OutboxRecord r;
  r.id               = row[0].as<uint64_t>();
  r.aggregate_type   = row[1].c_str();
  r.aggregate_id     = row[2].c_str();
  r.event_kind       = row[3].c_str();
  r.payload_json     = row[4].c_str();
  r.created_at_ms    = row[5].as<uint64_t>();
  r.processed_at_ms  = OptU64(row[6]);
  r.processed_by     = OptText(row[7]);
  r.retry_count      = row[8].as<uint32_t>();
  r.process_after_ms = row[9].as<uint64_t>();
  r.claimed_by       = OptText(row[10]);
  r.claimed_at_ms    = OptU64(row[11]);
  r.last_error       = Text(row[12]);
  return r;
}

const char* RetentionWhere(RetentionTable table) {
  switch (table) {
    case RetentionTable::DeadLetterArchive:
      return "dead_letter_archive WHERE archived_at < $1";
    case RetentionTable::ReplayLog:
      return "replay_log WHERE replayed_at < $1";
    case RetentionTable::ProcessedOutbox:
      return "outbox WHERE processed_at IS NOT NULL AND processed_at < $1";
  }
  throw util::InvalidState("unknown retention table");
}

Result Affected(const pqxx::result& res) {
  return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

template <typename Fn>
Result PgRepository::Guard(Fn&& fn) {
  try {
    return fn();
  } catch (const pqxx::transaction_rollback& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(e.what());
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  } catch (const pqxx::integrity_constraint_violation& e) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const pqxx::sql_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

template <typename Fn>
auto PgRepository::Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::transaction_rollback& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(e.what());
  }
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result PgRepository::CreateStream(Transaction& t, model::StreamRecord& r) {
  return Guard([&] {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params("INSERT INTO streams(name,created_at) VALUES($1,$2) ON CONFLICT(name) DO NOTHING RETURNING stream_id;",
                              r.name, r.created_at_ms);
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists);

    r.stream_id = res[0][0].as<uint64_t>();
    w.exec_params("INSERT INTO stream_offsets(stream_id,next_offset) VALUES($1,1);", r.stream_id);
    return Result::Ok(1);
  });
}

std::optional<model::StreamRecord> PgRepository::GetStreamByName(Transaction& t, const std::string& name) {
  return Read([&]() -> std::optional<model::StreamRecord> {
    auto res = TX(t).Work().exec_params("SELECT stream_id,name,created_at FROM streams WHERE name=$1;", name);
    if (res.empty()) return std::nullopt;

    model::StreamRecord r;
    r.stream_id     = res[0][0].as<uint64_t>();
    r.name          = res[0][1].c_str();
    r.created_at_ms = res[0][2].as<uint64_t>();
    return r;
  });
}

Result PgRepository::AppendStreamEntries(Transaction& t, uint64_t stream_id, std::vector<model::StreamEntryRecord>& entries) {
  return Guard([&] {
    auto& w = TX(t).Work();

    // Row lock on the offset counter serializes appenders of this stream.
    auto next = w.exec_params("SELECT next_offset FROM stream_offsets WHERE stream_id=$1 FOR UPDATE;", stream_id);
    if (next.empty()) return Result::Err(ErrorCode::NotFound, "stream not found");
    uint64_t next_offset = next[0][0].as<uint64_t>();

    // A unique violation would abort the whole transaction, so dedupe keys are checked first.
    for (const auto& e : entries) {
      if (e.dedupe_key.empty()) continue;
      auto dup = w.exec_params("SELECT 1 FROM stream_entries WHERE stream_id=$1 AND dedupe_key=$2;", stream_id, e.dedupe_key);
      if (!dup.empty()) return Result::Err(ErrorCode::AlreadyExists, "dedupe key " + e.dedupe_key);
    }

    for (auto& e : entries) {
      e.stream_id = stream_id;
      e.offset    = next_offset++;
      w.exec_params("INSERT INTO stream_entries(stream_id,msg_offset,fields,dedupe_key,append_time) VALUES($1,$2,$3::jsonb,$4,$5);",
                    e.stream_id, e.offset, sql::EncodeFields(e.fields), NullIfEmpty(e.dedupe_key), e.append_time_ms);
    }

    w.exec_params("UPDATE stream_offsets SET next_offset=$1 WHERE stream_id=$2;", next_offset, stream_id);
    return Result::Ok(entries.size());
  });
}

std::vector<model::StreamEntryRecord> PgRepository::ReadStreamEntries(Transaction& t, uint64_t stream_id, uint64_t start_offset,
                                                                      std::optional<uint64_t> max_entries) {
  return Read([&] {
    auto&       w   = TX(t).Work();
    std::string sql = std::string("SELECT ") + kEntryColumns + " FROM stream_entries WHERE stream_id=$1 AND msg_offset>=$2 ORDER BY msg_offset ASC";

    pqxx::result res;
    if (max_entries.has_value()) {
      res = w.exec_params(sql + " LIMIT $3;", stream_id, start_offset, *max_entries);
    } else {
      res = w.exec_params(sql + ";", stream_id, start_offset);
    }

    std::vector<model::StreamEntryRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadEntry(row));
    }
    return out;
  });
}

std::optional<model::StreamEntryRecord> PgRepository::GetStreamEntry(Transaction& t, uint64_t stream_id, uint64_t offset) {
  return Read([&]() -> std::optional<model::StreamEntryRecord> {
    auto res = TX(t).Work().exec_params(
        std::string("SELECT ") + kEntryColumns + " FROM stream_entries WHERE stream_id=$1 AND msg_offset=$2;", stream_id, offset);
    if (res.empty()) return std::nullopt;
    return ReadEntry(res[0]);
  });
}

std::optional<model::StreamEntryRecord> PgRepository::FindStreamEntryByDedupeKey(Transaction& t, uint64_t stream_id,
                                                                                 const std::string& dedupe_key) {
  return Read([&]() -> std::optional<model::StreamEntryRecord> {
    auto res = TX(t).Work().exec_params(
        std::string("SELECT ") + kEntryColumns + " FROM stream_entries WHERE stream_id=$1 AND dedupe_key=$2;", stream_id, dedupe_key);
    if (res.empty()) return std::nullopt;
    return ReadEntry(res[0]);
  });
}

uint64_t PgRepository::CountStreamEntries(Transaction& t, uint64_t stream_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM stream_entries WHERE stream_id=$1;", stream_id);
    return res[0][0].as<uint64_t>();
  });
}

Result PgRepository::DeleteStreamEntry(Transaction& t, uint64_t stream_id, uint64_t offset) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params("DELETE FROM stream_entries WHERE stream_id=$1 AND msg_offset=$2;", stream_id, offset));
  });
}

Result PgRepository::TrimStreamEntriesToMaxCount(Transaction& t, uint64_t stream_id, uint64_t max_entries) {
  return Guard([&] {
    auto& w     = TX(t).Work();
    auto  count = w.exec_params("SELECT COUNT(*) FROM stream_entries WHERE stream_id=$1;", stream_id)[0][0].as<uint64_t>();
    if (count <= max_entries) return Result::Ok(0);

    return Affected(w.exec_params(
        "DELETE FROM stream_entries WHERE stream_id=$1 AND msg_offset IN "
        "(SELECT msg_offset FROM stream_entries WHERE stream_id=$1 ORDER BY msg_offset ASC LIMIT $2);",
        stream_id, count - max_entries));
  });
}

// ------------------------------------------------------------------
// Consumer groups / pending-entry list
// ------------------------------------------------------------------

Result PgRepository::CreateConsumerGroup(Transaction& t, const model::ConsumerGroupRecord& r) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO consumer_groups(stream_id,group_name,last_delivered,created_at) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(stream_id,group_name) DO NOTHING;",
        r.stream_id, r.group_name, r.last_delivered_offset, r.created_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Affected(res);
  });
}

std::optional<model::ConsumerGroupRecord> PgRepository::GetConsumerGroup(Transaction& t, uint64_t stream_id, const std::string& group_name) {
  return Read([&]() -> std::optional<model::ConsumerGroupRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT stream_id,group_name,last_delivered,created_at FROM consumer_groups WHERE stream_id=$1 AND group_name=$2 FOR UPDATE;", stream_id,
        group_name);
    if (res.empty()) return std::nullopt;

    model::ConsumerGroupRecord r;
    r.stream_id             = res[0][0].as<uint64_t>();
    r.group_name            = res[0][1].c_str();
    r.last_delivered_offset = res[0][2].as<uint64_t>();
    r.created_at_ms         = res[0][3].as<uint64_t>();
    return r;
  });
}

Result PgRepository::AdvanceConsumerGroup(Transaction& t, uint64_t stream_id, const std::string& group_name,
                                          uint64_t last_delivered_offset) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params("UPDATE consumer_groups SET last_delivered=$1 WHERE stream_id=$2 AND group_name=$3;",
                                        last_delivered_offset, stream_id, group_name);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Affected(res);
  });
}

Result PgRepository::InsertPendingEntry(Transaction& t, const model::PendingEntryRecord& r) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO pending_entries(stream_id,group_name,msg_offset,consumer,delivered_at,delivery_count) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(stream_id,group_name,msg_offset) DO NOTHING;",
        r.stream_id, r.group_name, r.offset, r.consumer, r.delivered_at_ms, r.delivery_count);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Affected(res);
  });
}

std::optional<model::PendingEntryRecord> PgRepository::GetPendingEntry(Transaction& t, uint64_t stream_id, const std::string& group_name,
                                                                       uint64_t offset) {
  return Read([&]() -> std::optional<model::PendingEntryRecord> {
    auto res = TX(t).Work().exec_params(
        std::string("SELECT ") + kPendingColumns + " FROM pending_entries WHERE stream_id=$1 AND group_name=$2 AND msg_offset=$3;",
        stream_id, group_name, offset);
    if (res.empty()) return std::nullopt;
    return ReadPending(res[0]);
  });
}

std::vector<model::PendingEntryRecord> PgRepository::ListPendingEntries(Transaction& t, uint64_t stream_id, const std::string& group_name,
                                                                        uint64_t limit) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kPendingColumns +
                                            " FROM pending_entries WHERE stream_id=$1 AND group_name=$2 ORDER BY msg_offset ASC LIMIT $3;",
                                        stream_id, group_name, limit);
    std::vector<model::PendingEntryRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadPending(row));
    }
    return out;
  });
}

uint64_t PgRepository::CountPendingEntries(Transaction& t, uint64_t stream_id, const std::string& group_name) {
  return Read([&] {
    auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM pending_entries WHERE stream_id=$1 AND group_name=$2;", stream_id, group_name);
    return res[0][0].as<uint64_t>();
  });
}

Result PgRepository::ClaimPendingEntry(Transaction& t, uint64_t stream_id, const std::string& group_name, uint64_t offset,
                                       const std::string& consumer, uint64_t min_idle_ms, uint64_t now_ms) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "UPDATE pending_entries SET consumer=$1,delivered_at=$2,delivery_count=delivery_count+1 "
        "WHERE stream_id=$3 AND group_name=$4 AND msg_offset=$5 AND delivered_at+$6<=$2;",
        consumer, now_ms, stream_id, group_name, offset, min_idle_ms));
  });
}

Result PgRepository::DeletePendingEntry(Transaction& t, uint64_t stream_id, const std::string& group_name, uint64_t offset) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params("DELETE FROM pending_entries WHERE stream_id=$1 AND group_name=$2 AND msg_offset=$3;",
                                             stream_id, group_name, offset));
  });
}

// ------------------------------------------------------------------
// Reclaim attempt counters
// ------------------------------------------------------------------

std::optional<model::ReclaimAttemptRecord> PgRepository::GetReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset) {
  return Read([&]() -> std::optional<model::ReclaimAttemptRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT stream_id,msg_offset,attempts,updated_at FROM reclaim_attempts WHERE stream_id=$1 AND msg_offset=$2;", stream_id, offset);
    if (res.empty()) return std::nullopt;
    return ReadReclaim(res[0]);
  });
}

Result PgRepository::IncrementReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset, uint64_t now_ms) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "INSERT INTO reclaim_attempts(stream_id,msg_offset,attempts,updated_at) VALUES($1,$2,1,$3) "
        "ON CONFLICT(stream_id,msg_offset) DO UPDATE SET attempts=reclaim_attempts.attempts+1,updated_at=EXCLUDED.updated_at;",
        stream_id, offset, now_ms));
  });
}

Result PgRepository::DeleteReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params("DELETE FROM reclaim_attempts WHERE stream_id=$1 AND msg_offset=$2;", stream_id, offset));
  });
}

std::vector<model::ReclaimAttemptRecord> PgRepository::ListReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t limit) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT stream_id,msg_offset,attempts,updated_at FROM reclaim_attempts WHERE stream_id=$1 ORDER BY msg_offset ASC LIMIT $2;",
        stream_id, limit);
    std::vector<model::ReclaimAttemptRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadReclaim(row));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Replay ledger
// ------------------------------------------------------------------

Result PgRepository::InsertReplayLogIfAbsent(Transaction& t, const model::ReplayLogRecord& r) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO replay_log(original_stream,original_msg_id,dl_msg_id,candidate_id,idempotency_key,new_msg_id,replayed_by,status,replayed_at) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) ON CONFLICT(original_stream,original_msg_id) DO NOTHING;",
        r.original_stream, r.original_msg_id, r.dl_msg_id, r.candidate_id, r.idempotency_key, r.new_msg_id, r.replayed_by, r.status,
        r.replayed_at_ms == 0 ? util::NowMillis() : r.replayed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Affected(res);
  });
}

std::optional<model::ReplayLogRecord> PgRepository::GetReplayLog(Transaction& t, const std::string& original_stream,
                                                                const std::string& original_msg_id) {
  return Read([&]() -> std::optional<model::ReplayLogRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT original_stream,original_msg_id,dl_msg_id,candidate_id,idempotency_key,new_msg_id,replayed_by,status,replayed_at "
        "FROM replay_log WHERE original_stream=$1 AND original_msg_id=$2;",
        original_stream, original_msg_id);
    if (res.empty()) return std::nullopt;

    const auto&           row = res[0];
    model::ReplayLogRecord r;
    r.original_stream = row[0].c_str();
    r.original_msg_id = row[1].c_str();
    r.dl_msg_id       = Text(row[2]);
    r.candidate_id    = OptText(row[3]);
    r.idempotency_key = OptText(row[4]);
    r.new_msg_id      = OptText(row[5]);
    r.replayed_by     = Text(row[6]);
    r.status          = row[7].c_str();
    r.replayed_at_ms  = row[8].as<uint64_t>();
    return r;
  });
}

Result PgRepository::SetReplayLogNewMessageId(Transaction& t, const std::string& original_stream, const std::string& original_msg_id,
                                              const std::string& new_msg_id) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "UPDATE replay_log SET new_msg_id=$1 WHERE original_stream=$2 AND original_msg_id=$3 AND new_msg_id IS NULL;", new_msg_id,
        original_stream, original_msg_id));
  });
}

// ------------------------------------------------------------------
// Dead-letter archive
// ------------------------------------------------------------------

Result PgRepository::UpsertDeadLetterArchive(Transaction& t, const model::DeadLetterArchiveRecord& r) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "INSERT INTO dead_letter_archive(dl_stream,dl_msg_id,original_msg_id,candidate_id,payload,reason,dead_lettered_at,archived_at,archived_by) "
        "VALUES($1,$2,$3,$4,$5::jsonb,$6,$7,$8,$9) ON CONFLICT(dl_stream,dl_msg_id) DO UPDATE SET archived_at=EXCLUDED.archived_at;",
        r.dl_stream, r.dl_msg_id, r.original_msg_id, r.candidate_id, r.payload_json, r.reason, r.dead_lettered_at,
        r.archived_at_ms == 0 ? util::NowMillis() : r.archived_at_ms, r.archived_by));
  });
}

std::optional<model::DeadLetterArchiveRecord> PgRepository::GetDeadLetterArchive(Transaction& t, const std::string& dl_stream,
                                                                                const std::string& dl_msg_id) {
  return Read([&]() -> std::optional<model::DeadLetterArchiveRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT dl_stream,dl_msg_id,original_msg_id,candidate_id,payload::text,reason,dead_lettered_at,archived_at,archived_by "
        "FROM dead_letter_archive WHERE dl_stream=$1 AND dl_msg_id=$2;",
        dl_stream, dl_msg_id);
    if (res.empty()) return std::nullopt;

    const auto&                    row = res[0];
    model::DeadLetterArchiveRecord r;
    r.dl_stream        = row[0].c_str();
    r.dl_msg_id        = row[1].c_str();
    r.original_msg_id  = Text(row[2]);
    r.candidate_id     = OptText(row[3]);
    r.payload_json     = row[4].c_str();
    r.reason           = Text(row[5]);
    r.dead_lettered_at = Text(row[6]);
    r.archived_at_ms   = row[7].as<uint64_t>();
    r.archived_by      = Text(row[8]);
    return r;
  });
}

// ------------------------------------------------------------------
// Distributed locks
// ------------------------------------------------------------------

Result PgRepository::AcquireLock(Transaction& t, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                                 uint64_t expires_at_ms) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "INSERT INTO distributed_locks(lock_name,holder_id,acquired_at,expires_at) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(lock_name) DO UPDATE SET "
        "acquired_at=CASE WHEN distributed_locks.holder_id=EXCLUDED.holder_id THEN distributed_locks.acquired_at ELSE EXCLUDED.acquired_at END,"
        "holder_id=EXCLUDED.holder_id,expires_at=EXCLUDED.expires_at "
        "WHERE distributed_locks.expires_at<$3 OR distributed_locks.holder_id=EXCLUDED.holder_id;",
        lock_name, holder_id, now_ms, expires_at_ms));
  });
}

Result PgRepository::ExtendLock(Transaction& t, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                                uint64_t expires_at_ms) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "UPDATE distributed_locks SET expires_at=$1 WHERE lock_name=$2 AND holder_id=$3 AND expires_at>=$4;", expires_at_ms, lock_name,
        holder_id, now_ms));
  });
}

Result PgRepository::ReleaseLock(Transaction& t, const std::string& lock_name, const std::string& holder_id) {
  return Guard([&] {
    return Affected(
        TX(t).Work().exec_params("DELETE FROM distributed_locks WHERE lock_name=$1 AND holder_id=$2;", lock_name, holder_id));
  });
}

Result PgRepository::DeleteExpiredLocks(Transaction& t, uint64_t now_ms) {
  return Guard([&] { return Affected(TX(t).Work().exec_params("DELETE FROM distributed_locks WHERE expires_at<$1;", now_ms)); });
}

std::optional<model::LockRecord> PgRepository::GetLock(Transaction& t, const std::string& lock_name) {
  return Read([&]() -> std::optional<model::LockRecord> {
    auto res = TX(t).Work().exec_params(
        "SELECT lock_name,holder_id,acquired_at,expires_at FROM distributed_locks WHERE lock_name=$1;", lock_name);
    if (res.empty()) return std::nullopt;

    model::LockRecord r;
    r.lock_name      = res[0][0].c_str();
    r.holder_id      = res[0][1].c_str();
    r.acquired_at_ms = res[0][2].as<uint64_t>();
    r.expires_at_ms  = res[0][3].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Outbox
// ------------------------------------------------------------------

Result PgRepository::InsertOutbox(Transaction& t, model::OutboxRecord& r) {
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO outbox(aggregate_type,aggregate_id,event_kind,payload,created_at,retry_count,process_after,last_error) "
        "VALUES($1,$2,$3,$4::jsonb,$5,$6,$7,$8) RETURNING id;",
        r.aggregate_type, r.aggregate_id, r.event_kind, r.payload_json, r.created_at_ms, static_cast<int>(r.retry_count),
        r.process_after_ms == 0 ? r.created_at_ms : r.process_after_ms, NullIfEmpty(r.last_error));
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok(1);
  });
}

std::optional<model::OutboxRecord> PgRepository::GetOutbox(Transaction& t, uint64_t id) {
  return Read([&]() -> std::optional<model::OutboxRecord> {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kOutboxColumns + " FROM outbox WHERE id=$1;", id);
    if (res.empty()) return std::nullopt;
    return ReadOutbox(res[0]);
  });
}

std::vector<model::OutboxRecord> PgRepository::ClaimOutbox(Transaction& t, const std::string& processor_id, uint64_t batch_size,
                                                           uint64_t now_ms, uint64_t stale_claim_before_ms) {
  return Read([&] {
    // SKIP LOCKED lets concurrent processors take disjoint batches.
    auto res = TX(t).Work().exec_params(
        std::string("UPDATE outbox SET claimed_by=$1,claimed_at=$2 WHERE id IN ("
                    "SELECT id FROM outbox WHERE processed_at IS NULL AND process_after<=$2 AND (claimed_by IS NULL OR claimed_at<=$3) "
                    "ORDER BY created_at ASC, id ASC LIMIT $4 FOR UPDATE SKIP LOCKED) RETURNING ") +
            kOutboxColumns + ";",
        processor_id, now_ms, stale_claim_before_ms, batch_size);

    std::vector<model::OutboxRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadOutbox(row));
    }
    std::sort(out.begin(), out.end(), [](const model::OutboxRecord& a, const model::OutboxRecord& b) {
      return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
    });
    return out;
  });
}

Result PgRepository::MarkOutboxProcessed(Transaction& t, uint64_t id, const std::string& processor_id, uint64_t now_ms) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "UPDATE outbox SET processed_at=$1,processed_by=$2,claimed_by=NULL,claimed_at=NULL "
        "WHERE id=$3 AND processed_at IS NULL AND claimed_by=$2;",
        now_ms, processor_id, id));
  });
}

Result PgRepository::FailOutbox(Transaction& t, uint64_t id, const std::string& processor_id, uint32_t expected_retry_count,
                                uint64_t process_after_ms, const std::string& error) {
  return Guard([&] {
    return Affected(TX(t).Work().exec_params(
        "UPDATE outbox SET retry_count=retry_count+1,process_after=$1,last_error=$2,claimed_by=NULL,claimed_at=NULL "
        "WHERE id=$3 AND processed_at IS NULL AND claimed_by=$4 AND retry_count=$5;",
        process_after_ms, error, id, processor_id, static_cast<int>(expected_retry_count)));
  });
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

uint64_t PgRepository::CountExpired(Transaction& t, RetentionTable table, uint64_t cutoff_ms) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(std::string("SELECT COUNT(*) FROM ") + RetentionWhere(table) + ";", cutoff_ms);
    return res[0][0].as<uint64_t>();
  });
}

Result PgRepository::DeleteExpired(Transaction& t, RetentionTable table, uint64_t cutoff_ms) {
  return Guard([&] { return Affected(TX(t).Work().exec_params(std::string("DELETE FROM ") + RetentionWhere(table) + ";", cutoff_ms)); });
}

} // namespace redrive::db::postgres
