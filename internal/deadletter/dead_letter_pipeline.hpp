#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/util/time.hpp"

namespace redrive::deadletter {

using stream::FieldMap;
using stream::MessageId;

// Dead-letter entry layout.
inline constexpr const char* kOriginalMsgIdField  = "original_msg_id";
inline constexpr const char* kOriginalStreamField = "original_stream";
inline constexpr const char* kReasonField         = "reason";
inline constexpr const char* kDeadLetteredAtField = "dead_lettered_at";
inline constexpr const char* kConsumerField       = "consumer";
inline constexpr const char* kOriginalPrefix      = "orig_";

// Added to a replayed message.
inline constexpr const char* kReplayedFromField = "replayed_from_dl";
inline constexpr const char* kReplayedAtField   = "replayed_at";

/*
  External business-state check run before a replay: returns true when
  the work described by `original_fields` has already been carried out.
*/
using ProcessedStateCheck = std::function<bool(const FieldMap& original_fields)>;

struct DeadLetterOptions {
  std::string stream_key = "redrive:work:dead-letter";
  // Identity written to the replay ledger.
  std::string replayed_by;
};

struct ReplayOptions {
  bool check_idempotency       = true;
  bool check_already_processed = true;
};

struct ReplayAllOptions {
  uint64_t       batch_size  = 100;
  uint64_t       max_replays = 1000;
  ReplayOptions  replay;
  util::Deadline deadline;
};

struct ReplaySummary {
  uint64_t replayed = 0;
  uint64_t skipped  = 0;
  uint64_t errors   = 0;
  // false when the deadline stopped the run early.
  bool completed = true;
};

/*
  Dead-letter stream plus idempotent replay.

  Ordering contracts:
    MoveToDeadLetter: append to the dead-letter stream, then ack the original
    Replay: insert the replay ledger row, then re-enqueue, then delete the entry

  Dead-letter entries are keyed by the original message id, so moving the
  same message twice (crash between append and ack) yields one entry.
*/
class DeadLetterPipeline {
 public:
  DeadLetterPipeline(std::shared_ptr<queue::DurableQueue> queue, std::shared_ptr<db::Repository> repository, DeadLetterOptions options,
                     ProcessedStateCheck processed_check = {});

  // True once the dead-letter entry is durable, even if the ack then fails.
  bool MoveToDeadLetter(const MessageId& id, const FieldMap& fields, const std::string& reason);

  // New message id, or nullopt when skipped (already replayed/processed, lost a race) or failed.
  std::optional<MessageId> Replay(const MessageId& dl_id, const ReplayOptions& options = {});

  ReplaySummary ReplayAll(const ReplayAllOptions& options);

  uint64_t Count();

  // Dead-letter entry created for `original_id`, if any.
  std::optional<stream::StreamMessage> Find(const MessageId& original_id);

  const DeadLetterOptions& Options() const {
    return options_;
  }

  void SetProcessedStateCheck(ProcessedStateCheck processed_check) {
    processed_check_ = std::move(processed_check);
  }

 private:
  enum class ReplayOutcome { Replayed, NotFound, AlreadyReplayed, AlreadyProcessed, RaceLost, Failed };

  struct ReplayResult {
    ReplayOutcome            outcome = ReplayOutcome::Failed;
    std::optional<MessageId> new_id;
  };

  ReplayResult ReplayOne(const MessageId& dl_id, const ReplayOptions& options);

  std::shared_ptr<queue::DurableQueue> queue_;
  std::shared_ptr<db::Repository>      repository_;
  DeadLetterOptions                    options_;
  ProcessedStateCheck                  processed_check_;
};

// Strips the dead-letter prefix back off the original fields.
FieldMap ReconstructOriginalFields(const FieldMap& dl_fields);

} // namespace redrive::deadletter
