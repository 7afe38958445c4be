#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if REDRIVE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if REDRIVE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace redrive::factory {

using redrive::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

constexpr uint64_t kSecondsPerDay = 86400;

#if REDRIVE_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto        conn = pool->Acquire();
  pqxx::work  tx(*conn);
  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if REDRIVE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), static_cast<int>(database.sqlite().busy_timeout_ms()));
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    REDRIVE_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if REDRIVE_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections(), static_cast<int>(pg.statement_timeout_ms()));
    BootstrapPostgresSchema(pool);
    REDRIVE_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigError("postgres backend requested but not enabled at build time");
#endif
  }

  REDRIVE_LOG_WARN("Using in-memory repository, state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

RuntimeDependencies BuildRuntime(const RuntimeConfig& config) {
  return BuildRuntime(config, BuildRepository(config));
}

RuntimeDependencies BuildRuntime(const RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  RuntimeDependencies deps;
  deps.repository = std::move(repository);

  const auto& q  = config.queue();
  const auto& dl = config.dead_letter();
  const auto& ob = config.outbox();

  deps.streams = std::make_shared<stream::StreamStore>(deps.repository);

  queue::QueueOptions queue_options;
  queue_options.stream_key        = q.stream_key();
  queue_options.consumer_group    = q.consumer_group();
  queue_options.consumer_name     = q.consumer_name();
  queue_options.max_stream_length = q.max_stream_length();
  queue_options.block             = std::chrono::milliseconds(q.block_ms());
  deps.queue                      = std::make_shared<queue::DurableQueue>(deps.streams, queue_options);

  deadletter::DeadLetterOptions dl_options;
  dl_options.stream_key  = dl.stream_key();
  dl_options.replayed_by = q.consumer_name();
  deps.dead_letters      = std::make_shared<deadletter::DeadLetterPipeline>(deps.queue, deps.repository, dl_options);

  deps.reclaim = std::make_shared<queue::ReclaimScheduler>(deps.queue, deps.dead_letters,
                                                           queue::BackoffSettings{q.base_backoff_ms(), q.max_backoff_ms()});
  deps.trimmer = std::make_shared<deadletter::ArchiveTrimmer>(deps.streams, deps.repository, dl.stream_key());
  deps.locks   = std::make_shared<lock::DistributedLock>(deps.repository);

  outbox::OutboxOptions outbox_options;
  outbox_options.claim_timeout_ms   = ob.claim_timeout_ms();
  outbox_options.retry_base_ms      = ob.retry_base_ms();
  outbox_options.retry_max_exponent = ob.retry_max_exponent();
  deps.outbox                       = std::make_shared<outbox::OutboxProcessor>(deps.repository, outbox_options, deps.locks);

  deps.retention = std::make_shared<retention::RetentionGC>(deps.repository, deps.queue);

  deps.queue->EnsureConsumerGroup();
  return deps;
}

worker::MaintenanceOptions MaintenanceOptionsFrom(const RuntimeConfig& config) {
  const auto& q  = config.queue();
  const auto& dl = config.dead_letter();
  const auto& r  = config.retention();
  const auto& w  = config.worker();

  worker::MaintenanceOptions options;
  options.worker_id     = w.worker_id();
  options.interval      = std::chrono::milliseconds(w.maintenance_interval_ms());
  options.lock_ttl      = std::chrono::milliseconds(w.lock_ttl_ms());
  options.task_deadline = std::chrono::milliseconds(w.task_deadline_ms());

  options.reclaim.idle_threshold_ms               = q.claim_idle_ms();
  options.reclaim.max_reclaims_before_dead_letter = q.max_reclaim_attempts();
  options.reclaim.max_reclaim_per_pass            = q.max_reclaim_per_pass();
  options.reclaim.use_backoff                     = !q.disable_backoff();
  options.reclaim.scan_limit                      = q.pending_scan_limit();

  options.dead_letter_max_length = dl.max_length();
  options.outbox_batch_size      = config.outbox().batch_size();

  // Replay ledger rows outlive the replay tracking window.
  const auto tracking_days = static_cast<uint32_t>((dl.replay_tracking_ttl_sec() + kSecondsPerDay - 1) / kSecondsPerDay);

  options.retention.dead_letter_archive_days = r.dead_letter_archive_days();
  options.retention.replay_log_days          = std::max(r.replay_log_days(), tracking_days);
  options.retention.outbox_days              = r.outbox_days();
  options.retention.dry_run                  = r.dry_run();
  options.reclaim_attempts_ttl_sec           = q.reclaim_attempts_ttl_sec();
  return options;
}

} // namespace redrive::factory
