#include "internal/db/sql/migrations.hpp"

namespace redrive::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS streams (stream_id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, created_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS stream_entries (stream_id INTEGER NOT NULL REFERENCES streams(stream_id) ON DELETE CASCADE, msg_offset INTEGER NOT NULL, "
      "fields TEXT NOT NULL, dedupe_key TEXT, append_time INTEGER NOT NULL, PRIMARY KEY (stream_id, msg_offset));",
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_stream_entries_dedupe ON stream_entries(stream_id, dedupe_key) WHERE dedupe_key IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS stream_offsets (stream_id INTEGER PRIMARY KEY REFERENCES streams(stream_id) ON DELETE CASCADE, next_offset INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS consumer_groups (stream_id INTEGER NOT NULL REFERENCES streams(stream_id) ON DELETE CASCADE, group_name TEXT NOT NULL, "
      "last_delivered INTEGER NOT NULL DEFAULT 0, created_at INTEGER NOT NULL, PRIMARY KEY (stream_id, group_name));",
      "CREATE TABLE IF NOT EXISTS pending_entries (stream_id INTEGER NOT NULL, group_name TEXT NOT NULL, msg_offset INTEGER NOT NULL, consumer TEXT NOT NULL, "
      "delivered_at INTEGER NOT NULL, delivery_count INTEGER NOT NULL, PRIMARY KEY (stream_id, group_name, msg_offset), "
      "FOREIGN KEY (stream_id, group_name) REFERENCES consumer_groups(stream_id, group_name) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS reclaim_attempts (stream_id INTEGER NOT NULL, msg_offset INTEGER NOT NULL, attempts INTEGER NOT NULL, updated_at INTEGER NOT NULL, "
      "PRIMARY KEY (stream_id, msg_offset));",
      "CREATE TABLE IF NOT EXISTS replay_log (id INTEGER PRIMARY KEY AUTOINCREMENT, original_stream TEXT NOT NULL, original_msg_id TEXT NOT NULL, dl_msg_id TEXT, "
      "candidate_id TEXT, idempotency_key TEXT, new_msg_id TEXT, replayed_by TEXT, status TEXT NOT NULL DEFAULT 'replayed', replayed_at INTEGER NOT NULL, "
      "UNIQUE (original_stream, original_msg_id));",
      "CREATE INDEX IF NOT EXISTS idx_replay_log_replayed_at ON replay_log(replayed_at);",
      "CREATE TABLE IF NOT EXISTS dead_letter_archive (id INTEGER PRIMARY KEY AUTOINCREMENT, dl_stream TEXT NOT NULL, dl_msg_id TEXT NOT NULL, original_msg_id TEXT, "
      "candidate_id TEXT, payload TEXT NOT NULL, reason TEXT, dead_lettered_at TEXT, archived_at INTEGER NOT NULL, archived_by TEXT, "
      "UNIQUE (dl_stream, dl_msg_id));",
      "CREATE INDEX IF NOT EXISTS idx_dla_archived_at ON dead_letter_archive(archived_at);",
      "CREATE TABLE IF NOT EXISTS distributed_locks (lock_name TEXT PRIMARY KEY, holder_id TEXT NOT NULL, acquired_at INTEGER NOT NULL, expires_at INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_locks_expires ON distributed_locks(expires_at);",
      "CREATE TABLE IF NOT EXISTS outbox (id INTEGER PRIMARY KEY AUTOINCREMENT, aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, event_kind TEXT NOT NULL, "
      "payload TEXT NOT NULL, created_at INTEGER NOT NULL, processed_at INTEGER, processed_by TEXT, retry_count INTEGER NOT NULL DEFAULT 0, "
      "process_after INTEGER NOT NULL, claimed_by TEXT, claimed_at INTEGER, last_error TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_outbox_pending ON outbox(process_after) WHERE processed_at IS NULL;"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS streams (stream_id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE, created_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS stream_entries (stream_id BIGINT NOT NULL REFERENCES streams(stream_id) ON DELETE CASCADE, msg_offset BIGINT NOT NULL, "
      "fields JSONB NOT NULL, dedupe_key TEXT, append_time BIGINT NOT NULL, PRIMARY KEY (stream_id, msg_offset));",
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_stream_entries_dedupe ON stream_entries(stream_id, dedupe_key) WHERE dedupe_key IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS stream_offsets (stream_id BIGINT PRIMARY KEY REFERENCES streams(stream_id) ON DELETE CASCADE, next_offset BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS consumer_groups (stream_id BIGINT NOT NULL REFERENCES streams(stream_id) ON DELETE CASCADE, group_name TEXT NOT NULL, "
      "last_delivered BIGINT NOT NULL DEFAULT 0, created_at BIGINT NOT NULL, PRIMARY KEY (stream_id, group_name));",
      "CREATE TABLE IF NOT EXISTS pending_entries (stream_id BIGINT NOT NULL, group_name TEXT NOT NULL, msg_offset BIGINT NOT NULL, consumer TEXT NOT NULL, "
      "delivered_at BIGINT NOT NULL, delivery_count BIGINT NOT NULL, PRIMARY KEY (stream_id, group_name, msg_offset), "
      "FOREIGN KEY (stream_id, group_name) REFERENCES consumer_groups(stream_id, group_name) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS reclaim_attempts (stream_id BIGINT NOT NULL, msg_offset BIGINT NOT NULL, attempts BIGINT NOT NULL, updated_at BIGINT NOT NULL, "
      "PRIMARY KEY (stream_id, msg_offset));",
      "CREATE TABLE IF NOT EXISTS replay_log (id BIGSERIAL PRIMARY KEY, original_stream TEXT NOT NULL, original_msg_id TEXT NOT NULL, dl_msg_id TEXT, "
      "candidate_id TEXT, idempotency_key TEXT, new_msg_id TEXT, replayed_by TEXT, status TEXT NOT NULL DEFAULT 'replayed', replayed_at BIGINT NOT NULL, "
      "UNIQUE (original_stream, original_msg_id));",
      "CREATE INDEX IF NOT EXISTS idx_replay_log_replayed_at ON replay_log(replayed_at);",
      "CREATE TABLE IF NOT EXISTS dead_letter_archive (id BIGSERIAL PRIMARY KEY, dl_stream TEXT NOT NULL, dl_msg_id TEXT NOT NULL, original_msg_id TEXT, candidate_id TEXT, "
      "payload JSONB NOT NULL, reason TEXT, dead_lettered_at TEXT, archived_at BIGINT NOT NULL, archived_by TEXT, "
      "UNIQUE (dl_stream, dl_msg_id));",
      "CREATE INDEX IF NOT EXISTS idx_dla_archived_at ON dead_letter_archive(archived_at);",
      "CREATE TABLE IF NOT EXISTS distributed_locks (lock_name TEXT PRIMARY KEY, holder_id TEXT NOT NULL, acquired_at BIGINT NOT NULL, expires_at BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_locks_expires ON distributed_locks(expires_at);",
      "CREATE TABLE IF NOT EXISTS outbox (id BIGSERIAL PRIMARY KEY, aggregate_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, event_kind TEXT NOT NULL, "
      "payload JSONB NOT NULL, created_at BIGINT NOT NULL, processed_at BIGINT, processed_by TEXT, retry_count INTEGER NOT NULL DEFAULT 0, "
      "process_after BIGINT NOT NULL, claimed_by TEXT, claimed_at BIGINT, last_error TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_outbox_pending ON outbox(process_after) WHERE processed_at IS NULL;"};
  return kSchema;
}

} // namespace redrive::db::sql
