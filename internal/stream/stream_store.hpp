#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/stream_entry_record.hpp"

namespace redrive::stream {

using FieldMap  = db::model::FieldMap;
using MessageId = std::string;

struct StreamMessage {
  MessageId id;
  FieldMap  fields;
};

struct PendingInfo {
  MessageId   id;
  std::string consumer;
  uint64_t    idle_ms        = 0;
  uint64_t    delivery_count = 0;
};

struct AppendOutcome {
  MessageId id;
  // An entry with the same dedupe key already existed; `id` is that entry.
  bool duplicate = false;
};

struct StreamInfo {
  uint64_t  length  = 0;
  uint64_t  pending = 0;
  MessageId first_id;
  MessageId last_delivered_id;
};

// Message ids are the decimal stream offset.
MessageId               FormatId(uint64_t offset);
std::optional<uint64_t> ParseId(std::string_view id);

/*
  Append-only streams with consumer groups on top of the repository.

  Semantics:
    - ReadGroup hands out entries past the group cursor and records them
      in the pending-entry list (delivery_count = 1)
    - Ack removes the pending entry; the stream entry stays
    - Claim transfers a pending entry that has been idle long enough;
      first claimer wins, everybody else gets nullopt

  Unexpected store results throw util::StoreUnavailable. Callers decide
  whether that is fatal.
*/
class StreamStore {
 public:
  explicit StreamStore(std::shared_ptr<db::Repository> repository);

  // Returns the stream id, creating the stream on first use.
  uint64_t EnsureStream(const std::string& stream);

  // false when the group already existed.
  bool EnsureGroup(const std::string& stream, const std::string& group);

  // max_length > 0 trims the oldest entries after the append.
  AppendOutcome Append(const std::string& stream, const FieldMap& fields, uint64_t max_length = 0, const std::string& dedupe_key = {});

  // Waits up to `block` for new entries; empty on timeout.
  std::vector<StreamMessage> ReadGroup(const std::string& stream, const std::string& group, const std::string& consumer, uint64_t count,
                                       std::chrono::milliseconds block);

  // Number of pending entries removed (0 or 1).
  uint64_t Ack(const std::string& stream, const std::string& group, const MessageId& id);

  bool Delete(const std::string& stream, const MessageId& id);

  std::vector<PendingInfo> Pending(const std::string& stream, const std::string& group, uint64_t limit);

  std::optional<StreamMessage> Claim(const std::string& stream, const std::string& group, const std::string& consumer, const MessageId& id,
                                     uint64_t min_idle_ms);

  // Entries strictly after `after` ("" = from the start), oldest first.
  std::vector<StreamMessage> Range(const std::string& stream, const MessageId& after, uint64_t count);

  std::optional<StreamMessage> Get(const std::string& stream, const MessageId& id);

  std::optional<StreamMessage> FindByDedupeKey(const std::string& stream, const std::string& dedupe_key);

  uint64_t Length(const std::string& stream);

  // Entries removed.
  uint64_t Trim(const std::string& stream, uint64_t max_length);

  StreamInfo Info(const std::string& stream, const std::string& group);

  // ---------------------------------------------------------------------
  // Reclaim attempt counters
  // ---------------------------------------------------------------------

  uint64_t ReclaimAttempts(const std::string& stream, const MessageId& id);
  uint64_t IncrementReclaimAttempts(const std::string& stream, const MessageId& id);
  void     ClearReclaimAttempts(const std::string& stream, const MessageId& id);

 private:
  static constexpr std::chrono::milliseconds kPollInterval{50};

  std::optional<uint64_t>    LookupStream(const std::string& stream);
  std::vector<StreamMessage> ReadGroupOnce(uint64_t stream_id, const std::string& group, const std::string& consumer, uint64_t count);
  void                       NotifyAppend();

  std::shared_ptr<db::Repository> repository_;

  std::mutex                                cache_mutex_;
  std::unordered_map<std::string, uint64_t> stream_ids_;

  // Wakes blocked readers in this process; other processes are picked up by polling.
  std::mutex              wait_mutex_;
  std::condition_variable appended_;
  uint64_t                append_seq_ = 0;
};

} // namespace redrive::stream
