#include "dead_letter_pipeline.hpp"

#include <string_view>

#include "internal/db/api/run_transaction.hpp"
#include "internal/db/model/replay_log_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/best_effort.hpp"

namespace redrive::deadletter {

using observability::StringField;

namespace {

std::optional<std::string> FieldOrNull(const FieldMap& fields, const char* key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

} // namespace

FieldMap ReconstructOriginalFields(const FieldMap& dl_fields) {
  constexpr std::string_view prefix(kOriginalPrefix);

  FieldMap out;
  for (const auto& [key, value] : dl_fields) {
    if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
      out[key.substr(prefix.size())] = value;
    }
  }
  return out;
}

DeadLetterPipeline::DeadLetterPipeline(std::shared_ptr<queue::DurableQueue> queue, std::shared_ptr<db::Repository> repository,
                                       DeadLetterOptions options, ProcessedStateCheck processed_check)
    : queue_(std::move(queue)), repository_(std::move(repository)), options_(std::move(options)), processed_check_(std::move(processed_check)) {
}

bool DeadLetterPipeline::MoveToDeadLetter(const MessageId& id, const FieldMap& fields, const std::string& reason) {
  const auto& queue_options = queue_->Options();

  FieldMap dl_fields;
  dl_fields[kOriginalMsgIdField]  = id;
  dl_fields[kOriginalStreamField] = queue_options.stream_key;
  dl_fields[kReasonField]         = reason;
  dl_fields[kDeadLetteredAtField] = util::ToIso8601(util::Now());
  dl_fields[kConsumerField]       = queue_options.consumer_name;
  for (const auto& [key, value] : fields) {
    dl_fields[kOriginalPrefix + key] = value;
  }

  // Step 1: the dead-letter entry must be durable before the original is acked.
  stream::AppendOutcome appended;
  try {
    appended = queue_->Store().Append(options_.stream_key, dl_fields, 0, id);
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to move message to dead-letter", {StringField("msg_id", id), StringField("error", e.what())});
    return false;
  }

  if (appended.duplicate) {
    REDRIVE_LOG_INFO("Message already dead-lettered, acking stale pending entry",
                     {StringField("msg_id", id), StringField("dl_msg_id", appended.id)});
  }

  // Step 2: ack. A failure leaves a pending entry that the next reclaim pass heals.
  try {
    const auto acked = queue_->Store().Ack(queue_options.stream_key, queue_options.consumer_group, id);
    if (acked == 0) {
      REDRIVE_LOG_WARN("Ack returned 0, message may already be acknowledged", {StringField("msg_id", id)});
    }
  } catch (const std::exception& e) {
    REDRIVE_LOG_WARN("Ack failed after dead-letter insert, pending entry remains",
                     {StringField("msg_id", id), StringField("dl_msg_id", appended.id), StringField("error", e.what())});
  }

  REDRIVE_LOG_WARN("Moved message to dead-letter stream",
                   {StringField("msg_id", id), StringField("reason", reason), StringField("dl_msg_id", appended.id)});
  return true;
}

DeadLetterPipeline::ReplayResult DeadLetterPipeline::ReplayOne(const MessageId& dl_id, const ReplayOptions& options) {
  try {
    // Step 1: read the dead-letter entry.
    const auto entry = queue_->Store().Get(options_.stream_key, dl_id);
    if (!entry) {
      REDRIVE_LOG_WARN("Dead-letter message not found", {StringField("dl_msg_id", dl_id)});
      return {ReplayOutcome::NotFound, std::nullopt};
    }

    const auto& dl_fields         = entry->fields;
    const auto  original_msg_id   = FieldOrNull(dl_fields, kOriginalMsgIdField).value_or(dl_id);
    const auto  original_stream   = FieldOrNull(dl_fields, kOriginalStreamField).value_or(queue_->Options().stream_key);
    const auto  candidate_id      = FieldOrNull(dl_fields, "orig_candidate_id");
    const auto  idempotency_key   = FieldOrNull(dl_fields, "orig_idempotency_key");
    auto        fields            = ReconstructOriginalFields(dl_fields);

    db::model::ReplayLogRecord ledger;
    ledger.original_stream = original_stream;
    ledger.original_msg_id = original_msg_id;
    ledger.dl_msg_id       = dl_id;
    ledger.candidate_id    = candidate_id;
    ledger.idempotency_key = idempotency_key;
    ledger.replayed_by     = options_.replayed_by;

    // Step 2: ledger lookup.
    if (options.check_idempotency) {
      const auto existing = db::RunTransaction(
          *repository_, [&](db::Transaction& tx) { return repository_->GetReplayLog(tx, original_stream, original_msg_id); });
      if (existing) {
        REDRIVE_LOG_INFO("Dead-letter already replayed", {StringField("dl_msg_id", dl_id), StringField("original_msg_id", original_msg_id)});
        return {ReplayOutcome::AlreadyReplayed, std::nullopt};
      }
    }

    // Step 3: external processed-state check.
    if (options.check_already_processed && processed_check_) {
      bool processed = false;
      try {
        processed = processed_check_(fields);
      } catch (const std::exception& e) {
        REDRIVE_LOG_WARN("Processed-state check failed, continuing replay", {StringField("dl_msg_id", dl_id), StringField("error", e.what())});
      }

      if (processed) {
        ledger.status         = db::model::kReplayStatusAlreadyProcessed;
        ledger.replayed_at_ms = util::NowMillis();
        util::BestEffort("record already-processed replay", [&] {
          db::RunTransaction(*repository_, [&](db::Transaction& tx) {
            const auto result = repository_->InsertReplayLogIfAbsent(tx, ledger);
            if (result.code != db::ErrorCode::AlreadyExists) {
              db::ThrowIfError(result, "insert replay log");
            }
          });
        });
        REDRIVE_LOG_INFO("Dead-letter already processed, skipping replay", {StringField("dl_msg_id", dl_id)});
        return {ReplayOutcome::AlreadyProcessed, std::nullopt};
      }
    }

    // Step 4: replay metadata.
    fields[kReplayedFromField] = dl_id;
    fields[kReplayedAtField]   = util::ToIso8601(util::Now());

    // Step 5: record intent before re-enqueueing; the insert is the race arbiter.
    ledger.status         = db::model::kReplayStatusReplayed;
    ledger.replayed_at_ms = util::NowMillis();
    const bool recorded   = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
      const auto result = repository_->InsertReplayLogIfAbsent(tx, ledger);
      if (result.code == db::ErrorCode::AlreadyExists) {
        return false;
      }
      db::ThrowIfError(result, "insert replay log");
      return true;
    });
    if (!recorded) {
      REDRIVE_LOG_INFO("Dead-letter replay recorded by another process", {StringField("dl_msg_id", dl_id)});
      return {ReplayOutcome::RaceLost, std::nullopt};
    }

    // Step 6: re-enqueue.
    const auto new_id = queue_->Enqueue(fields, queue_->Options().max_stream_length);
    if (!new_id) {
      REDRIVE_LOG_ERROR("Re-enqueue failed for replay, dead-letter entry kept",
                        {StringField("dl_msg_id", dl_id), StringField("original_msg_id", original_msg_id)});
      return {ReplayOutcome::Failed, std::nullopt};
    }

    // Step 7: follow-ups; the message is already back on the main stream.
    util::BestEffort("record replay message id", [&] {
      db::RunTransaction(*repository_, [&](db::Transaction& tx) {
        db::ThrowIfError(repository_->SetReplayLogNewMessageId(tx, original_stream, original_msg_id, *new_id), "set replay message id");
      });
    });
    util::BestEffort("delete replayed dead-letter", [&] { queue_->Store().Delete(options_.stream_key, dl_id); });

    REDRIVE_LOG_INFO("Replayed dead-letter", {StringField("dl_msg_id", dl_id), StringField("new_msg_id", *new_id)});
    return {ReplayOutcome::Replayed, new_id};
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to replay dead-letter", {StringField("dl_msg_id", dl_id), StringField("error", e.what())});
    return {ReplayOutcome::Failed, std::nullopt};
  }
}

std::optional<MessageId> DeadLetterPipeline::Replay(const MessageId& dl_id, const ReplayOptions& options) {
  return ReplayOne(dl_id, options).new_id;
}

ReplaySummary DeadLetterPipeline::ReplayAll(const ReplayAllOptions& options) {
  ReplaySummary summary;
  MessageId     last_id;
  uint64_t      processed = 0;

  try {
    while (processed < options.max_replays) {
      const auto page = queue_->Store().Range(options_.stream_key, last_id, options.batch_size);
      if (page.empty()) {
        break;
      }

      for (const auto& entry : page) {
        if (processed >= options.max_replays) {
          break;
        }
        if (options.deadline.Expired()) {
          summary.completed = false;
          break;
        }

        switch (ReplayOne(entry.id, options.replay).outcome) {
          case ReplayOutcome::Replayed:
            ++summary.replayed;
            break;
          case ReplayOutcome::Failed:
            ++summary.errors;
            break;
          default:
            ++summary.skipped;
            break;
        }

        ++processed;
        last_id = entry.id;
      }

      if (!summary.completed || page.size() < options.batch_size) {
        break;
      }
    }
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to replay dead-letters", {StringField("error", e.what())});
    ++summary.errors;
  }

  REDRIVE_LOG_INFO("Dead-letter replay complete", {observability::IntField("replayed", static_cast<int64_t>(summary.replayed)),
                                                   observability::IntField("skipped", static_cast<int64_t>(summary.skipped)),
                                                   observability::IntField("errors", static_cast<int64_t>(summary.errors)),
                                                   observability::BoolField("completed", summary.completed)});
  return summary;
}

uint64_t DeadLetterPipeline::Count() {
  try {
    return queue_->Store().Length(options_.stream_key);
  } catch (const std::exception& e) {
    REDRIVE_LOG_WARN("Failed to count dead-letters", {StringField("error", e.what())});
    return 0;
  }
}

std::optional<stream::StreamMessage> DeadLetterPipeline::Find(const MessageId& original_id) {
  try {
    return queue_->Store().FindByDedupeKey(options_.stream_key, original_id);
  } catch (const std::exception& e) {
    REDRIVE_LOG_WARN("Failed to look up dead-letter", {StringField("original_msg_id", original_id), StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace redrive::deadletter
