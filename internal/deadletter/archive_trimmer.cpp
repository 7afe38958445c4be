#include "archive_trimmer.hpp"

#include <vector>

#include "dead_letter_pipeline.hpp"
#include "internal/db/api/run_transaction.hpp"
#include "internal/db/sql/field_codec.hpp"
#include "internal/observability/logging.hpp"

namespace redrive::deadletter {

using observability::IntField;
using observability::StringField;

namespace {

std::string FieldOr(const FieldMap& fields, const char* key, std::string fallback = {}) {
  const auto it = fields.find(key);
  return it == fields.end() ? fallback : it->second;
}

} // namespace

ArchiveTrimmer::ArchiveTrimmer(std::shared_ptr<stream::StreamStore> store, std::shared_ptr<db::Repository> repository,
                               std::string dead_letter_stream, std::string archived_by)
    : store_(std::move(store)),
      repository_(std::move(repository)),
      dead_letter_stream_(std::move(dead_letter_stream)),
      archived_by_(std::move(archived_by)) {
}

void ArchiveTrimmer::Archive(const stream::StreamMessage& entry) {
  db::model::DeadLetterArchiveRecord record;
  record.dl_stream        = dead_letter_stream_;
  record.dl_msg_id        = entry.id;
  record.original_msg_id  = FieldOr(entry.fields, kOriginalMsgIdField);
  record.payload_json     = db::sql::EncodeFields(entry.fields);
  record.reason           = FieldOr(entry.fields, kReasonField);
  record.dead_lettered_at = FieldOr(entry.fields, kDeadLetteredAtField);
  record.archived_at_ms   = util::NowMillis();
  record.archived_by      = archived_by_;

  const auto candidate = FieldOr(entry.fields, "orig_candidate_id");
  if (!candidate.empty()) {
    record.candidate_id = candidate;
  }

  db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfError(repository_->UpsertDeadLetterArchive(tx, record), "archive dead-letter");
  });
}

ArchiveSummary ArchiveTrimmer::ArchiveAndTrim(uint64_t max_dead_letter_length, const util::Deadline& deadline) {
  ArchiveSummary summary;

  try {
    const auto length = store_->Length(dead_letter_stream_);
    if (length <= max_dead_letter_length) {
      REDRIVE_LOG_DEBUG("Dead-letter stream within limit, no trim needed", {IntField("length", static_cast<int64_t>(length))});
      return summary;
    }

    const auto entries = store_->Range(dead_letter_stream_, {}, length - max_dead_letter_length);

    std::vector<MessageId> archived_ids;
    for (const auto& entry : entries) {
      if (deadline.Expired()) {
        summary.completed = false;
        break;
      }
      try {
        Archive(entry);
        archived_ids.push_back(entry.id);
        ++summary.archived;
      } catch (const std::exception& e) {
        ++summary.errors;
        REDRIVE_LOG_ERROR("Failed to archive dead-letter message", {StringField("dl_msg_id", entry.id), StringField("error", e.what())});
      }
    }

    // Only archived entries are removed from the stream.
    for (const auto& id : archived_ids) {
      try {
        if (store_->Delete(dead_letter_stream_, id)) {
          ++summary.trimmed;
        }
      } catch (const std::exception& e) {
        ++summary.errors;
        REDRIVE_LOG_WARN("Failed to trim archived dead-letter", {StringField("dl_msg_id", id), StringField("error", e.what())});
      }
    }

    if (summary.trimmed > 0) {
      REDRIVE_LOG_INFO("Archived and trimmed dead-letter stream", {IntField("archived", static_cast<int64_t>(summary.archived)),
                                                                  IntField("trimmed", static_cast<int64_t>(summary.trimmed))});
    }
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to archive and trim dead-letter stream", {StringField("error", e.what())});
    return ArchiveSummary{0, 0, 1, false};
  }
  return summary;
}

} // namespace redrive::deadletter
