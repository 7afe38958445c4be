#include "reclaim_scheduler.hpp"

#include "internal/deadletter/dead_letter_pipeline.hpp"
#include "internal/observability/logging.hpp"

namespace redrive::queue {

using observability::IntField;
using observability::StringField;

ReclaimScheduler::ReclaimScheduler(std::shared_ptr<DurableQueue> queue, std::shared_ptr<deadletter::DeadLetterPipeline> dead_letters,
                                   BackoffSettings backoff)
    : queue_(std::move(queue)), dead_letters_(std::move(dead_letters)), backoff_(backoff) {
}

ReclaimSummary ReclaimScheduler::ReclaimStalled(const ReclaimOptions& options) {
  ReclaimSummary summary;
  const auto&    queue_options = queue_->Options();
  auto&          store         = queue_->Store();

  std::vector<stream::PendingInfo> pending;
  try {
    pending = store.Pending(queue_options.stream_key, queue_options.consumer_group, options.scan_limit);
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to process stalled messages", {StringField("error", e.what())});
    ++summary.errors;
    return summary;
  }

  struct Candidate {
    MessageId id;
    uint64_t  min_idle_ms = 0;
  };

  const BackoffPolicy    policy(options.idle_threshold_ms, backoff_.base_ms, backoff_.max_ms);
  std::vector<Candidate> candidates;
  std::vector<MessageId> dead_letter_ids;

  for (const auto& entry : pending) {
    if (entry.delivery_count >= options.max_reclaims_before_dead_letter) {
      dead_letter_ids.push_back(entry.id);
      continue;
    }

    const uint64_t required_idle = options.use_backoff ? policy.RequiredIdle(queue_->ReclaimAttempts(entry.id)) : options.idle_threshold_ms;
    if (entry.idle_ms < required_idle) {
      ++summary.backoff_deferred;
      REDRIVE_LOG_DEBUG("Message deferred by backoff", {StringField("msg_id", entry.id), IntField("idle_ms", static_cast<int64_t>(entry.idle_ms)),
                                                        IntField("required_ms", static_cast<int64_t>(required_idle))});
      continue;
    }

    candidates.push_back({entry.id, required_idle});
  }

  // Rate limit; no priority ordering, the pending list order decides.
  if (candidates.size() > options.max_reclaim_per_pass) {
    summary.skipped = candidates.size() - options.max_reclaim_per_pass;
    candidates.resize(options.max_reclaim_per_pass);
  }

  for (const auto& [id, min_idle_ms] : candidates) {
    try {
      // Same idle bound the candidate was selected with.
      const auto claimed =
          store.Claim(queue_options.stream_key, queue_options.consumer_group, queue_options.consumer_name, id, min_idle_ms);
      if (!claimed) {
        ++summary.claim_missed;
        REDRIVE_LOG_DEBUG("Reclaim lost to a concurrent claimer", {StringField("msg_id", id)});
        continue;
      }
      ++summary.reclaimed;

      if (options.use_backoff) {
        const auto attempts = queue_->IncrementReclaimAttempts(id);
        REDRIVE_LOG_INFO("Reclaimed stalled message", {StringField("msg_id", id), IntField("attempt", static_cast<int64_t>(attempts)),
                                                       IntField("next_backoff_ms", static_cast<int64_t>(policy.RequiredIdle(attempts)))});
      } else {
        REDRIVE_LOG_INFO("Reclaimed stalled message", {StringField("msg_id", id)});
      }
    } catch (const std::exception& e) {
      ++summary.errors;
      REDRIVE_LOG_ERROR("Failed to reclaim message", {StringField("msg_id", id), StringField("error", e.what())});
    }
  }

  for (const auto& id : dead_letter_ids) {
    DeadLetter(id, summary);
  }

  if (summary.skipped > 0) {
    REDRIVE_LOG_INFO("Rate-limited reclaims", {IntField("skipped", static_cast<int64_t>(summary.skipped)),
                                               IntField("max_per_pass", static_cast<int64_t>(options.max_reclaim_per_pass))});
  }
  if (summary.backoff_deferred > 0) {
    REDRIVE_LOG_DEBUG("Backoff deferred messages", {IntField("count", static_cast<int64_t>(summary.backoff_deferred))});
  }
  return summary;
}

void ReclaimScheduler::DeadLetter(const MessageId& id, ReclaimSummary& summary) {
  const auto& queue_options = queue_->Options();
  auto&       store         = queue_->Store();

  try {
    const auto message = store.Get(queue_options.stream_key, id);
    if (!message) {
      // Trimmed while pending: nothing left to preserve.
      REDRIVE_LOG_WARN("Pending message no longer in stream, acking", {StringField("msg_id", id)});
      store.Ack(queue_options.stream_key, queue_options.consumer_group, id);
      queue_->ClearReclaimAttempts(id);
      return;
    }

    if (dead_letters_->MoveToDeadLetter(id, message->fields, kMaxReclaimsExceeded)) {
      ++summary.dead_lettered;
      queue_->ClearReclaimAttempts(id);
    } else {
      ++summary.errors;
    }
  } catch (const std::exception& e) {
    ++summary.errors;
    REDRIVE_LOG_ERROR("Failed to dead-letter message", {StringField("msg_id", id), StringField("error", e.what())});
  }
}

std::vector<Delivery> ReclaimScheduler::ClaimStalled(uint64_t idle_ms, uint64_t limit) {
  const auto&           queue_options = queue_->Options();
  auto&                 store         = queue_->Store();
  std::vector<Delivery> out;

  try {
    for (const auto& entry : store.Pending(queue_options.stream_key, queue_options.consumer_group, limit)) {
      if (entry.idle_ms < idle_ms) {
        continue;
      }
      if (auto claimed = store.Claim(queue_options.stream_key, queue_options.consumer_group, queue_options.consumer_name, entry.id, idle_ms)) {
        REDRIVE_LOG_INFO("Claimed stalled message", {StringField("msg_id", claimed->id)});
        out.push_back(std::move(*claimed));
      }
    }
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to claim stalled messages", {StringField("error", e.what())});
  }
  return out;
}

} // namespace redrive::queue
