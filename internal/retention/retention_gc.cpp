#include "retention_gc.hpp"

#include <utility>
#include <vector>

#include "internal/db/api/run_transaction.hpp"
#include "internal/observability/logging.hpp"

namespace redrive::retention {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint64_t kMillisPerDay = 86400000ULL;

uint64_t CutoffFor(uint64_t now_ms, uint64_t window_ms) {
  return now_ms > window_ms ? now_ms - window_ms : 0;
}

} // namespace

RetentionGC::RetentionGC(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::DurableQueue> queue)
    : repository_(std::move(repository)), queue_(std::move(queue)) {
}

TableRetention RetentionGC::Collect(db::RetentionTable table, uint32_t days, bool dry_run) {
  const auto cutoff = CutoffFor(util::NowMillis(), static_cast<uint64_t>(days) * kMillisPerDay);

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    TableRetention out;
    out.candidates = repository_->CountExpired(tx, table, cutoff);
    if (!dry_run && out.candidates > 0) {
      const auto r = repository_->DeleteExpired(tx, table, cutoff);
      db::ThrowIfError(r, "delete expired rows");
      out.deleted = r.affected;
    }
    return out;
  });
}

RetentionReport RetentionGC::RunAll(const RetentionPolicy& policy, const util::Deadline& deadline) {
  RetentionReport report;

  const std::vector<std::pair<db::RetentionTable, uint32_t>> windows = {
      {db::RetentionTable::DeadLetterArchive, policy.dead_letter_archive_days},
      {db::RetentionTable::ReplayLog, policy.replay_log_days},
      {db::RetentionTable::ProcessedOutbox, policy.outbox_days},
  };

  for (const auto& [table, days] : windows) {
    if (days == 0) {
      continue;
    }
    if (deadline.Expired()) {
      report.completed = false;
      break;
    }
    try {
      const auto result                = Collect(table, days, policy.dry_run);
      report.tables[ToString(table)] = result;
      REDRIVE_LOG_INFO("Retention pass", {StringField("table", ToString(table)), IntField("candidates", static_cast<int64_t>(result.candidates)),
                                          IntField("deleted", static_cast<int64_t>(result.deleted)), BoolField("dry_run", policy.dry_run)});
    } catch (const std::exception& e) {
      ++report.errors;
      REDRIVE_LOG_ERROR("Retention pass failed", {StringField("table", ToString(table)), StringField("error", e.what())});
    }
  }
  return report;
}

uint64_t RetentionGC::CleanupExpiredLocks() {
  try {
    return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      const auto r = repository_->DeleteExpiredLocks(tx, util::NowMillis());
      db::ThrowIfError(r, "delete expired locks");
      return r.affected;
    });
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to delete expired locks", {StringField("error", e.what())});
    return 0;
  }
}

std::optional<TableRetention> RetentionGC::CollectReclaimAttempts(uint64_t ttl_sec, bool dry_run, uint64_t scan_limit) {
  const auto& options = queue_->Options();
  try {
    const auto stream_id = queue_->Store().EnsureStream(options.stream_key);
    const auto stale     = CutoffFor(util::NowMillis(), ttl_sec * 1000);

    auto out = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      TableRetention result;
      for (const auto& counter : repository_->ListReclaimAttempts(tx, stream_id, scan_limit)) {
        const bool orphaned = !repository_->GetPendingEntry(tx, stream_id, options.consumer_group, counter.offset).has_value();
        if (!orphaned && counter.updated_at_ms >= stale) {
          continue;
        }
        ++result.candidates;
        if (!dry_run) {
          const auto r = repository_->DeleteReclaimAttempts(tx, stream_id, counter.offset);
          db::ThrowIfError(r, "delete reclaim counter");
          result.deleted += r.affected;
        }
      }
      return result;
    });

    if (out.candidates > 0) {
      REDRIVE_LOG_INFO("Reclaim counter collection", {IntField("candidates", static_cast<int64_t>(out.candidates)),
                                                      IntField("deleted", static_cast<int64_t>(out.deleted)), BoolField("dry_run", dry_run)});
    }
    return out;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to collect reclaim counters", {StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace redrive::retention
