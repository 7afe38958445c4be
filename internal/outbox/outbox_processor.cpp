#include "outbox_processor.hpp"

#include <algorithm>
#include <limits>

#include "internal/db/api/run_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace redrive::outbox {

using observability::IntField;
using observability::StringField;

OutboxProcessor::OutboxProcessor(std::shared_ptr<db::Repository> repository, OutboxOptions options,
                                 std::shared_ptr<lock::DistributedLock> guard)
    : repository_(std::move(repository)), options_(std::move(options)), guard_(std::move(guard)) {
}

uint64_t OutboxProcessor::RetryDelayMs(uint32_t retry_count) const {
  const uint32_t exponent = std::min(retry_count == 0 ? 0u : retry_count - 1, std::min(options_.retry_max_exponent, 62u));
  const uint64_t factor   = uint64_t{1} << exponent;
  if (options_.retry_base_ms > std::numeric_limits<uint64_t>::max() / factor) {
    return std::numeric_limits<uint64_t>::max();
  }
  return options_.retry_base_ms * factor;
}

std::vector<OutboxRecord> OutboxProcessor::Claim(const std::string& processor_id, uint64_t batch_size) {
  if (batch_size == 0) {
    return {};
  }
  try {
    auto records = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      const auto now         = util::NowMillis();
      const auto stale_claim = now > options_.claim_timeout_ms ? now - options_.claim_timeout_ms : 0;
      return repository_->ClaimOutbox(tx, processor_id, batch_size, now, stale_claim);
    });
    if (!records.empty()) {
      REDRIVE_LOG_DEBUG("Claimed outbox records",
                        {StringField("processor", processor_id), IntField("count", static_cast<int64_t>(records.size()))});
    }
    return records;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to claim outbox records", {StringField("processor", processor_id), StringField("error", e.what())});
    return {};
  }
}

void OutboxProcessor::Complete(uint64_t event_id, const std::string& processor_id, bool success, const std::string& error) {
  try {
    const auto affected = db::RunTransaction(*repository_, [&](db::Transaction& tx) -> uint64_t {
      const auto now = util::NowMillis();
      if (success) {
        const auto r = repository_->MarkOutboxProcessed(tx, event_id, processor_id, now);
        db::ThrowIfError(r, "mark outbox processed");
        return r.affected;
      }

      const auto current = repository_->GetOutbox(tx, event_id);
      if (!current || current->processed_at_ms || current->claimed_by != processor_id) {
        return 0;
      }
      const auto next_retry = current->retry_count + 1;
      const auto delay      = RetryDelayMs(next_retry);
      const auto after      = delay > std::numeric_limits<uint64_t>::max() - now ? std::numeric_limits<uint64_t>::max() : now + delay;

      const auto r = repository_->FailOutbox(tx, event_id, processor_id, current->retry_count, after, error);
      db::ThrowIfError(r, "fail outbox");
      return r.affected;
    });

    if (affected == 0) {
      REDRIVE_LOG_WARN("Outbox completion ignored, record not owned by processor",
                       {IntField("event_id", static_cast<int64_t>(event_id)), StringField("processor", processor_id)});
      return;
    }
    if (!success) {
      REDRIVE_LOG_WARN("Outbox delivery failed, rescheduled",
                       {IntField("event_id", static_cast<int64_t>(event_id)), StringField("error", error)});
    }
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to complete outbox record",
                      {IntField("event_id", static_cast<int64_t>(event_id)), StringField("error", e.what())});
  }
}

OutboxBatchSummary OutboxProcessor::ProcessBatch(const OutboxSink& sink, const std::string& processor_id, uint64_t batch_size) {
  OutboxBatchSummary summary;

  std::unique_ptr<lock::ScopedLock> held;
  if (guard_) {
    held = std::make_unique<lock::ScopedLock>(*guard_, options_.lock_name, processor_id, options_.lock_ttl);
    if (!held->Acquired()) {
      summary.ran = false;
      return summary;
    }
  }

  const auto records = Claim(processor_id, batch_size);
  summary.claimed    = records.size();

  for (const auto& record : records) {
    std::string error;
    bool        ok = true;
    try {
      sink(record);
    } catch (const std::exception& e) {
      ok    = false;
      error = e.what();
    }
    Complete(record.id, processor_id, ok, error);
    ok ? ++summary.delivered : ++summary.failed;
  }
  return summary;
}

} // namespace redrive::outbox
