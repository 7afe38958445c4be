#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/field_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace redrive::db::sqlite {

using redrive::db::ErrorCode;
using redrive::db::Result;

namespace {

/*
  Prepared statement owned for the duration of one repository call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }

  sqlite3_stmt* Get() const {
    return st_;
  }

  // Reads must not silently turn store failures into "no rows".
  sqlite3_stmt* GetOrThrow() const {
    if (!Prepared()) {
      throw util::StoreUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    }
    return st_;
  }

  bool NextRow() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StoreUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s.has_value()) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

constexpr const char* kEntryColumns = "stream_id,msg_offset,fields,COALESCE(dedupe_key,''),append_time";

model::StreamEntryRecord ReadEntry(sqlite3_stmt* st) {
  model::StreamEntryRecord e;
  e.stream_id      = ColU64(st, 0);
  e.offset         = ColU64(st, 1);
  e.fields         = sql::DecodeFields(ColText(st, 2));
  e.dedupe_key     = ColText(st, 3);
  e.append_time_ms = ColU64(st, 4);
  return e;
}

constexpr const char* kPendingColumns = "stream_id,group_name,msg_offset,consumer,delivered_at,delivery_count";

model::PendingEntryRecord ReadPending(sqlite3_stmt* st) {
  model::PendingEntryRecord p;
  p.stream_id       = ColU64(st, 0);
  p.group_name      = ColText(st, 1);
  p.offset          = ColU64(st, 2);
  p.consumer        = ColText(st, 3);
  p.delivered_at_ms = ColU64(st, 4);
  p.delivery_count  = ColU64(st, 5);
  return p;
}

constexpr const char* kOutboxColumns =
    "id,aggregate_type,aggregate_id,event_kind,payload,created_at,processed_at,processed_by,retry_count,process_after,claimed_by,"
    "claimed_at,COALESCE(last_error,'')";

model::OutboxRecord ReadOutbox(sqlite3_stmt* st) {
  model::OutboxRecord r;
  r.id               = ColU64(st, 0);
  r.aggregate_type   = ColText(st, 1);
  r.aggregate_id     = ColText(st, 2);
  r.event_kind       = ColText(st, 3);
  r.payload_json     = ColText(st, 4);
  r.created_at_ms    = ColU64(st, 5);
  r.processed_at_ms  = ColOptU64(st, 6);
  r.processed_by     = ColOptText(st, 7);
  r.retry_count      = static_cast<uint32_t>(sqlite3_column_int(st, 8));
  r.process_after_ms = ColU64(st, 9);
  r.claimed_by       = ColOptText(st, 10);
  r.claimed_at_ms    = ColOptU64(st, 11);
  r.last_error       = ColText(st, 12);
  return r;
}

const char* RetentionWhere(RetentionTable table) {
  switch (table) {
    case RetentionTable::DeadLetterArchive:
      return "dead_letter_archive WHERE archived_at < ?";
    case RetentionTable::ReplayLog:
      return "replay_log WHERE replayed_at < ?";
    case RetentionTable::ProcessedOutbox:
      return "outbox WHERE processed_at IS NOT NULL AND processed_at < ?";
  }
  throw util::InvalidState("unknown retention table");
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result SqliteRepository::CreateStream(Transaction& t, model::StreamRecord& r) {
  auto* db = TX(t).Handle();

  Statement ins(db, "INSERT INTO streams(name,created_at) VALUES(?,?);");
  if (!ins.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(ins.Get(), 1, r.name);
  BindU64(ins.Get(), 2, r.created_at_ms);
  auto result = Translate(db, sqlite3_step(ins.Get()));
  if (!result) return result;

  r.stream_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));

  Statement offsets(db, "INSERT INTO stream_offsets(stream_id,next_offset) VALUES(?,1);");
  if (!offsets.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(offsets.Get(), 1, r.stream_id);
  return Translate(db, sqlite3_step(offsets.Get()));
}

std::optional<model::StreamRecord> SqliteRepository::GetStreamByName(Transaction& t, const std::string& name) {
  Statement st(TX(t).Handle(), "SELECT stream_id,name,created_at FROM streams WHERE name=?;");
  BindText(st.GetOrThrow(), 1, name);
  if (!st.NextRow()) return std::nullopt;

  model::StreamRecord r;
  r.stream_id     = ColU64(st.Get(), 0);
  r.name          = ColText(st.Get(), 1);
  r.created_at_ms = ColU64(st.Get(), 2);
  return r;
}

Result SqliteRepository::AppendStreamEntries(
    Transaction& t, uint64_t stream_id, std::vector<model::StreamEntryRecord>& entries) {
  auto* db = TX(t).Handle();

  Statement next(db, "SELECT next_offset FROM stream_offsets WHERE stream_id=?;");
  BindU64(next.GetOrThrow(), 1, stream_id);
  if (!next.NextRow()) return Result::Err(ErrorCode::NotFound, "stream not found");
  uint64_t next_offset = ColU64(next.Get(), 0);

  // Checked up front so a duplicate in a batch leaves no partial append behind.
  for (const auto& e : entries) {
    if (!e.dedupe_key.empty() && FindStreamEntryByDedupeKey(t, stream_id, e.dedupe_key).has_value()) {
      return Result::Err(ErrorCode::AlreadyExists, "duplicate dedupe key " + e.dedupe_key);
    }
  }

  Statement ins(db, "INSERT INTO stream_entries(stream_id,msg_offset,fields,dedupe_key,append_time) VALUES(?,?,?,?,?);");
  if (!ins.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (auto& e : entries) {
    e.stream_id = stream_id;
    e.offset    = next_offset++;

    sqlite3_reset(ins.Get());
    sqlite3_clear_bindings(ins.Get());

    BindU64(ins.Get(), 1, e.stream_id);
    BindU64(ins.Get(), 2, e.offset);
    BindText(ins.Get(), 3, sql::EncodeFields(e.fields));
    if (e.dedupe_key.empty()) {
      sqlite3_bind_null(ins.Get(), 4);
    } else {
      BindText(ins.Get(), 4, e.dedupe_key);
    }
    BindU64(ins.Get(), 5, e.append_time_ms);

    int rc = sqlite3_step(ins.Get());
    if (rc != SQLITE_DONE) {
      return Translate(db, rc);
    }
  }

  Statement upd(db, "UPDATE stream_offsets SET next_offset=? WHERE stream_id=?;");
  if (!upd.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(upd.Get(), 1, next_offset);
  BindU64(upd.Get(), 2, stream_id);
  auto result = Translate(db, sqlite3_step(upd.Get()));
  if (!result) return result;
  return Result::Ok(entries.size());
}

std::vector<model::StreamEntryRecord> SqliteRepository::ReadStreamEntries(
    Transaction& t, uint64_t stream_id, uint64_t start_offset, std::optional<uint64_t> max_entries) {
  std::string sql = std::string("SELECT ") + kEntryColumns + " FROM stream_entries WHERE stream_id=? AND msg_offset>=? ORDER BY msg_offset ASC";
  if (max_entries.has_value()) {
    sql += " LIMIT ?";
  }
  sql += ";";

  Statement st(TX(t).Handle(), sql.c_str());
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindU64(st.Get(), 2, start_offset);
  if (max_entries.has_value()) {
    BindU64(st.Get(), 3, *max_entries);
  }

  std::vector<model::StreamEntryRecord> out;
  while (st.NextRow()) {
    out.push_back(ReadEntry(st.Get()));
  }
  return out;
}

std::optional<model::StreamEntryRecord> SqliteRepository::GetStreamEntry(Transaction& t, uint64_t stream_id, uint64_t offset) {
  const auto sql = std::string("SELECT ") + kEntryColumns + " FROM stream_entries WHERE stream_id=? AND msg_offset=?;";
  Statement  st(TX(t).Handle(), sql.c_str());
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindU64(st.Get(), 2, offset);
  if (!st.NextRow()) return std::nullopt;
  return ReadEntry(st.Get());
}

std::optional<model::StreamEntryRecord> SqliteRepository::FindStreamEntryByDedupeKey(Transaction& t, uint64_t stream_id,
                                                                                     const std::string& dedupe_key) {
  const auto sql = std::string("SELECT ") + kEntryColumns + " FROM stream_entries WHERE stream_id=? AND dedupe_key=?;";
  Statement  st(TX(t).Handle(), sql.c_str());
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindText(st.Get(), 2, dedupe_key);
  if (!st.NextRow()) return std::nullopt;
  return ReadEntry(st.Get());
}

uint64_t SqliteRepository::CountStreamEntries(Transaction& t, uint64_t stream_id) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM stream_entries WHERE stream_id=?;");
  BindU64(st.GetOrThrow(), 1, stream_id);
  return st.NextRow() ? ColU64(st.Get(), 0) : 0;
}

Result SqliteRepository::DeleteStreamEntry(Transaction& t, uint64_t stream_id, uint64_t offset) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM stream_entries WHERE stream_id=? AND msg_offset=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, stream_id);
  BindU64(st.Get(), 2, offset);
  return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::TrimStreamEntriesToMaxCount(Transaction& t, uint64_t stream_id, uint64_t max_entries) {
  const auto count = CountStreamEntries(t, stream_id);
  if (count <= max_entries) {
    return Result::Ok(0);
  }

  auto*     db = TX(t).Handle();
  Statement st(db,
               "DELETE FROM stream_entries WHERE stream_id=? AND msg_offset IN "
               "(SELECT msg_offset FROM stream_entries WHERE stream_id=? ORDER BY msg_offset ASC LIMIT ?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, stream_id);
  BindU64(st.Get(), 2, stream_id);
  BindU64(st.Get(), 3, count - max_entries);
  return Translate(db, sqlite3_step(st.Get()));
}

// ------------------------------------------------------------------
// Consumer groups / pending-entry list
// ------------------------------------------------------------------

Result SqliteRepository::CreateConsumerGroup(Transaction& t, const model::ConsumerGroupRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO consumer_groups(stream_id,group_name,last_delivered,created_at) VALUES(?,?,?,?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, r.stream_id);
  BindText(st.Get(), 2, r.group_name);
  BindU64(st.Get(), 3, r.last_delivered_offset);
  BindU64(st.Get(), 4, r.created_at_ms);
  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::ConsumerGroupRecord> SqliteRepository::GetConsumerGroup(Transaction& t, uint64_t stream_id,
                                                                             const std::string& group_name) {
  Statement st(TX(t).Handle(), "SELECT stream_id,group_name,last_delivered,created_at FROM consumer_groups WHERE stream_id=? AND group_name=?;");
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindText(st.Get(), 2, group_name);
  if (!st.NextRow()) return std::nullopt;

  model::ConsumerGroupRecord r;
  r.stream_id             = ColU64(st.Get(), 0);
  r.group_name            = ColText(st.Get(), 1);
  r.last_delivered_offset = ColU64(st.Get(), 2);
  r.created_at_ms         = ColU64(st.Get(), 3);
  return r;
}

Result SqliteRepository::AdvanceConsumerGroup(Transaction& t, uint64_t stream_id, const std::string& group_name,
                                              uint64_t last_delivered_offset) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE consumer_groups SET last_delivered=? WHERE stream_id=? AND group_name=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, last_delivered_offset);
  BindU64(st.Get(), 2, stream_id);
  BindText(st.Get(), 3, group_name);
  auto result = Translate(db, sqlite3_step(st.Get()));
  if (result && result.affected == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

Result SqliteRepository::InsertPendingEntry(Transaction& t, const model::PendingEntryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO pending_entries(stream_id,group_name,msg_offset,consumer,delivered_at,delivery_count) "
               "VALUES(?,?,?,?,?,?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, r.stream_id);
  BindText(st.Get(), 2, r.group_name);
  BindU64(st.Get(), 3, r.offset);
  BindText(st.Get(), 4, r.consumer);
  BindU64(st.Get(), 5, r.delivered_at_ms);
  BindU64(st.Get(), 6, r.delivery_count);
  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::PendingEntryRecord> SqliteRepository::GetPendingEntry(Transaction& t, uint64_t stream_id,
                                                                           const std::string& group_name, uint64_t offset) {
  const auto sql = std::string("SELECT ") + kPendingColumns + " FROM pending_entries WHERE stream_id=? AND group_name=? AND msg_offset=?;";
  Statement  st(TX(t).Handle(), sql.c_str());
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindText(st.Get(), 2, group_name);
  BindU64(st.Get(), 3, offset);
  if (!st.NextRow()) return std::nullopt;
  return ReadPending(st.Get());
}

std::vector<model::PendingEntryRecord> SqliteRepository::ListPendingEntries(Transaction& t, uint64_t stream_id,
                                                                            const std::string& group_name, uint64_t limit) {
  const auto sql =
      std::string("SELECT ") + kPendingColumns + " FROM pending_entries WHERE stream_id=? AND group_name=? ORDER BY msg_offset ASC LIMIT ?;";
  Statement st(TX(t).Handle(), sql.c_str());
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindText(st.Get(), 2, group_name);
  BindU64(st.Get(), 3, limit);

  std::vector<model::PendingEntryRecord> out;
  while (st.NextRow()) {
    out.push_back(ReadPending(st.Get()));
  }
  return out;
}

uint64_t SqliteRepository::CountPendingEntries(Transaction& t, uint64_t stream_id, const std::string& group_name) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM pending_entries WHERE stream_id=? AND group_name=?;");
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindText(st.Get(), 2, group_name);
  return st.NextRow() ? ColU64(st.Get(), 0) : 0;
}

Result SqliteRepository::ClaimPendingEntry(Transaction& t, uint64_t stream_id, const std::string& group_name, uint64_t offset,
                                           const std::string& consumer, uint64_t min_idle_ms, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE pending_entries SET consumer=?,delivered_at=?,delivery_count=delivery_count+1 "
               "WHERE stream_id=? AND group_name=? AND msg_offset=? AND delivered_at+?<=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.Get(), 1, consumer);
  BindU64(st.Get(), 2, now_ms);
  BindU64(st.Get(), 3, stream_id);
  BindText(st.Get(), 4, group_name);
  BindU64(st.Get(), 5, offset);
  BindU64(st.Get(), 6, min_idle_ms);
  BindU64(st.Get(), 7, now_ms);
  return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::DeletePendingEntry(Transaction& t, uint64_t stream_id, const std::string& group_name, uint64_t offset) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM pending_entries WHERE stream_id=? AND group_name=? AND msg_offset=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, stream_id);
  BindText(st.Get(), 2, group_name);
  BindU64(st.Get(), 3, offset);
  return Translate(db, sqlite3_step(st.Get()));
}

// ------------------------------------------------------------------
// Reclaim attempt counters
// ------------------------------------------------------------------

std::optional<model::ReclaimAttemptRecord> SqliteRepository::GetReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset) {
  Statement st(TX(t).Handle(), "SELECT stream_id,msg_offset,attempts,updated_at FROM reclaim_attempts WHERE stream_id=? AND msg_offset=?;");
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindU64(st.Get(), 2, offset);
  if (!st.NextRow()) return std::nullopt;

  model::ReclaimAttemptRecord r;
  r.stream_id     = ColU64(st.Get(), 0);
  r.offset        = ColU64(st.Get(), 1);
  r.attempts      = ColU64(st.Get(), 2);
  r.updated_at_ms = ColU64(st.Get(), 3);
  return r;
}

Result SqliteRepository::IncrementReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO reclaim_attempts(stream_id,msg_offset,attempts,updated_at) VALUES(?,?,1,?) "
               "ON CONFLICT(stream_id,msg_offset) DO UPDATE SET attempts=attempts+1,updated_at=excluded.updated_at;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, stream_id);
  BindU64(st.Get(), 2, offset);
  BindU64(st.Get(), 3, now_ms);
  return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::DeleteReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM reclaim_attempts WHERE stream_id=? AND msg_offset=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, stream_id);
  BindU64(st.Get(), 2, offset);
  return Translate(db, sqlite3_step(st.Get()));
}

std::vector<model::ReclaimAttemptRecord> SqliteRepository::ListReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t limit) {
  Statement st(TX(t).Handle(),
               "SELECT stream_id,msg_offset,attempts,updated_at FROM reclaim_attempts WHERE stream_id=? ORDER BY msg_offset ASC LIMIT ?;");
  BindU64(st.GetOrThrow(), 1, stream_id);
  BindU64(st.Get(), 2, limit);

  std::vector<model::ReclaimAttemptRecord> out;
  while (st.NextRow()) {
    model::ReclaimAttemptRecord r;
    r.stream_id     = ColU64(st.Get(), 0);
    r.offset        = ColU64(st.Get(), 1);
    r.attempts      = ColU64(st.Get(), 2);
    r.updated_at_ms = ColU64(st.Get(), 3);
    out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Replay ledger
// ------------------------------------------------------------------

Result SqliteRepository::InsertReplayLogIfAbsent(Transaction& t, const model::ReplayLogRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO replay_log(original_stream,original_msg_id,dl_msg_id,candidate_id,idempotency_key,new_msg_id,replayed_by,status,"
               "replayed_at) VALUES(?,?,?,?,?,?,?,?,?) ON CONFLICT(original_stream,original_msg_id) DO NOTHING;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.Get(), 1, r.original_stream);
  BindText(st.Get(), 2, r.original_msg_id);
  BindText(st.Get(), 3, r.dl_msg_id);
  BindOptText(st.Get(), 4, r.candidate_id);
  BindOptText(st.Get(), 5, r.idempotency_key);
  BindOptText(st.Get(), 6, r.new_msg_id);
  BindText(st.Get(), 7, r.replayed_by);
  BindText(st.Get(), 8, r.status);
  BindU64(st.Get(), 9, r.replayed_at_ms == 0 ? util::NowMillis() : r.replayed_at_ms);
  auto result = Translate(db, sqlite3_step(st.Get()));
  if (result && result.affected == 0) return Result::Err(ErrorCode::AlreadyExists);
  return result;
}

std::optional<model::ReplayLogRecord> SqliteRepository::GetReplayLog(Transaction& t, const std::string& original_stream,
                                                                    const std::string& original_msg_id) {
  Statement st(TX(t).Handle(),
               "SELECT original_stream,original_msg_id,COALESCE(dl_msg_id,''),candidate_id,idempotency_key,new_msg_id,COALESCE(replayed_by,''),"
               "status,replayed_at FROM replay_log WHERE original_stream=? AND original_msg_id=?;");
  BindText(st.GetOrThrow(), 1, original_stream);
  BindText(st.Get(), 2, original_msg_id);
  if (!st.NextRow()) return std::nullopt;

  model::ReplayLogRecord r;
  r.original_stream = ColText(st.Get(), 0);
  r.original_msg_id = ColText(st.Get(), 1);
  r.dl_msg_id       = ColText(st.Get(), 2);
  r.candidate_id    = ColOptText(st.Get(), 3);
  r.idempotency_key = ColOptText(st.Get(), 4);
  r.new_msg_id      = ColOptText(st.Get(), 5);
  r.replayed_by     = ColText(st.Get(), 6);
  r.status          = ColText(st.Get(), 7);
  r.replayed_at_ms  = ColU64(st.Get(), 8);
  return r;
}

Result SqliteRepository::SetReplayLogNewMessageId(Transaction& t, const std::string& original_stream, const std::string& original_msg_id,
                                                  const std::string& new_msg_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE replay_log SET new_msg_id=? WHERE original_stream=? AND original_msg_id=? AND new_msg_id IS NULL;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.Get(), 1, new_msg_id);
  BindText(st.Get(), 2, original_stream);
  BindText(st.Get(), 3, original_msg_id);
  return Translate(db, sqlite3_step(st.Get()));
}

// ------------------------------------------------------------------
// Dead-letter archive
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDeadLetterArchive(Transaction& t, const model::DeadLetterArchiveRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO dead_letter_archive(dl_stream,dl_msg_id,original_msg_id,candidate_id,payload,reason,dead_lettered_at,archived_at,"
               "archived_by) VALUES(?,?,?,?,?,?,?,?,?) ON CONFLICT(dl_stream,dl_msg_id) DO UPDATE SET archived_at=excluded.archived_at;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.Get(), 1, r.dl_stream);
  BindText(st.Get(), 2, r.dl_msg_id);
  BindText(st.Get(), 3, r.original_msg_id);
  BindOptText(st.Get(), 4, r.candidate_id);
  BindText(st.Get(), 5, r.payload_json);
  BindText(st.Get(), 6, r.reason);
  BindText(st.Get(), 7, r.dead_lettered_at);
  BindU64(st.Get(), 8, r.archived_at_ms == 0 ? util::NowMillis() : r.archived_at_ms);
  BindText(st.Get(), 9, r.archived_by);
  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::DeadLetterArchiveRecord> SqliteRepository::GetDeadLetterArchive(Transaction& t, const std::string& dl_stream,
                                                                                    const std::string& dl_msg_id) {
  Statement st(TX(t).Handle(),
               "SELECT dl_stream,dl_msg_id,COALESCE(original_msg_id,''),candidate_id,payload,COALESCE(reason,''),COALESCE(dead_lettered_at,''),"
               "archived_at,COALESCE(archived_by,'') FROM dead_letter_archive WHERE dl_stream=? AND dl_msg_id=?;");
  BindText(st.GetOrThrow(), 1, dl_stream);
  BindText(st.Get(), 2, dl_msg_id);
  if (!st.NextRow()) return std::nullopt;

  model::DeadLetterArchiveRecord r;
  r.dl_stream        = ColText(st.Get(), 0);
  r.dl_msg_id        = ColText(st.Get(), 1);
  r.original_msg_id  = ColText(st.Get(), 2);
  r.candidate_id     = ColOptText(st.Get(), 3);
  r.payload_json     = ColText(st.Get(), 4);
  r.reason           = ColText(st.Get(), 5);
  r.dead_lettered_at = ColText(st.Get(), 6);
  r.archived_at_ms   = ColU64(st.Get(), 7);
  r.archived_by      = ColText(st.Get(), 8);
  return r;
}

// ------------------------------------------------------------------
// Distributed locks
// ------------------------------------------------------------------

Result SqliteRepository::AcquireLock(Transaction& t, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                                     uint64_t expires_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO distributed_locks(lock_name,holder_id,acquired_at,expires_at) VALUES(?1,?2,?3,?4) "
               "ON CONFLICT(lock_name) DO UPDATE SET "
               "acquired_at=CASE WHEN distributed_locks.holder_id=excluded.holder_id THEN distributed_locks.acquired_at ELSE excluded.acquired_at END,"
               "holder_id=excluded.holder_id,expires_at=excluded.expires_at "
               "WHERE distributed_locks.expires_at<?3 OR distributed_locks.holder_id=excluded.holder_id;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.Get(), 1, lock_name);
  BindText(st.Get(), 2, holder_id);
  BindU64(st.Get(), 3, now_ms);
  BindU64(st.Get(), 4, expires_at_ms);
  return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::ExtendLock(Transaction& t, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                                    uint64_t expires_at_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE distributed_locks SET expires_at=? WHERE lock_name=? AND holder_id=? AND expires_at>=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, expires_at_ms);
  BindText(st.Get(), 2, lock_name);
  BindText(st.Get(), 3, holder_id);
  BindU64(st.Get(), 4, now_ms);
  return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::ReleaseLock(Transaction& t, const std::string& lock_name, const std::string& holder_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM distributed_locks WHERE lock_name=? AND holder_id=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.Get(), 1, lock_name);
  BindText(st.Get(), 2, holder_id);
  return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::DeleteExpiredLocks(Transaction& t, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM distributed_locks WHERE expires_at<?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, now_ms);
  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::LockRecord> SqliteRepository::GetLock(Transaction& t, const std::string& lock_name) {
  Statement st(TX(t).Handle(), "SELECT lock_name,holder_id,acquired_at,expires_at FROM distributed_locks WHERE lock_name=?;");
  BindText(st.GetOrThrow(), 1, lock_name);
  if (!st.NextRow()) return std::nullopt;

  model::LockRecord r;
  r.lock_name      = ColText(st.Get(), 0);
  r.holder_id      = ColText(st.Get(), 1);
  r.acquired_at_ms = ColU64(st.Get(), 2);
  r.expires_at_ms  = ColU64(st.Get(), 3);
  return r;
}

// ------------------------------------------------------------------
// Outbox
// ------------------------------------------------------------------

Result SqliteRepository::InsertOutbox(Transaction& t, model::OutboxRecord& r) {
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO outbox(aggregate_type,aggregate_id,event_kind,payload,created_at,retry_count,process_after,last_error) "
               "VALUES(?,?,?,?,?,?,?,?);");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.Get(), 1, r.aggregate_type);
  BindText(st.Get(), 2, r.aggregate_id);
  BindText(st.Get(), 3, r.event_kind);
  BindText(st.Get(), 4, r.payload_json);
  BindU64(st.Get(), 5, r.created_at_ms);
  sqlite3_bind_int(st.Get(), 6, static_cast<int>(r.retry_count));
  BindU64(st.Get(), 7, r.process_after_ms == 0 ? r.created_at_ms : r.process_after_ms);
  BindText(st.Get(), 8, r.last_error);
  auto result = Translate(db, sqlite3_step(st.Get()));
  if (result) {
    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return result;
}

std::optional<model::OutboxRecord> SqliteRepository::GetOutbox(Transaction& t, uint64_t id) {
  const auto sql = std::string("SELECT ") + kOutboxColumns + " FROM outbox WHERE id=?;";
  Statement  st(TX(t).Handle(), sql.c_str());
  BindU64(st.GetOrThrow(), 1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadOutbox(st.Get());
}

std::vector<model::OutboxRecord> SqliteRepository::ClaimOutbox(Transaction& t, const std::string& processor_id, uint64_t batch_size,
                                                               uint64_t now_ms, uint64_t stale_claim_before_ms) {
  auto* db = TX(t).Handle();

  // BEGIN IMMEDIATE already holds the write lock, so select-then-update is atomic.
  std::vector<uint64_t> ids;
  {
    Statement st(db,
                 "SELECT id FROM outbox WHERE processed_at IS NULL AND process_after<=? "
                 "AND (claimed_by IS NULL OR claimed_at<=?) ORDER BY created_at ASC, id ASC LIMIT ?;");
    BindU64(st.GetOrThrow(), 1, now_ms);
    BindU64(st.Get(), 2, stale_claim_before_ms);
    BindU64(st.Get(), 3, batch_size);
    while (st.NextRow()) {
      ids.push_back(ColU64(st.Get(), 0));
    }
  }

  std::vector<model::OutboxRecord> out;
  Statement                        upd(db, "UPDATE outbox SET claimed_by=?,claimed_at=? WHERE id=?;");
  upd.GetOrThrow();
  for (auto id : ids) {
    sqlite3_reset(upd.Get());
    sqlite3_clear_bindings(upd.Get());
    BindText(upd.Get(), 1, processor_id);
    BindU64(upd.Get(), 2, now_ms);
    BindU64(upd.Get(), 3, id);
    if (sqlite3_step(upd.Get()) != SQLITE_DONE) {
      throw util::StoreUnavailable(std::string("sqlite claim outbox: ") + sqlite3_errmsg(db));
    }
    if (auto record = GetOutbox(t, id)) {
      out.push_back(std::move(*record));
    }
  }
  return out;
}

Result SqliteRepository::MarkOutboxProcessed(Transaction& t, uint64_t id, const std::string& processor_id, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE outbox SET processed_at=?,processed_by=?,claimed_by=NULL,claimed_at=NULL "
               "WHERE id=? AND processed_at IS NULL AND claimed_by=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, now_ms);
  BindText(st.Get(), 2, processor_id);
  BindU64(st.Get(), 3, id);
  BindText(st.Get(), 4, processor_id);
  return Translate(db, sqlite3_step(st.Get()));
}

Result SqliteRepository::FailOutbox(Transaction& t, uint64_t id, const std::string& processor_id, uint32_t expected_retry_count,
                                    uint64_t process_after_ms, const std::string& error) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE outbox SET retry_count=?,process_after=?,last_error=?,claimed_by=NULL,claimed_at=NULL "
               "WHERE id=? AND processed_at IS NULL AND claimed_by=? AND retry_count=?;");
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  sqlite3_bind_int(st.Get(), 1, static_cast<int>(expected_retry_count + 1));
  BindU64(st.Get(), 2, process_after_ms);
  BindText(st.Get(), 3, error);
  BindU64(st.Get(), 4, id);
  BindText(st.Get(), 5, processor_id);
  sqlite3_bind_int(st.Get(), 6, static_cast<int>(expected_retry_count));
  return Translate(db, sqlite3_step(st.Get()));
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

uint64_t SqliteRepository::CountExpired(Transaction& t, RetentionTable table, uint64_t cutoff_ms) {
  const auto sql = std::string("SELECT COUNT(*) FROM ") + RetentionWhere(table) + ";";
  Statement  st(TX(t).Handle(), sql.c_str());
  BindU64(st.GetOrThrow(), 1, cutoff_ms);
  return st.NextRow() ? ColU64(st.Get(), 0) : 0;
}

Result SqliteRepository::DeleteExpired(Transaction& t, RetentionTable table, uint64_t cutoff_ms) {
  auto*      db  = TX(t).Handle();
  const auto sql = std::string("DELETE FROM ") + RetentionWhere(table) + ";";
  Statement  st(db, sql.c_str());
  if (!st.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.Get(), 1, cutoff_ms);
  return Translate(db, sqlite3_step(st.Get()));
}

} // namespace redrive::db::sqlite
