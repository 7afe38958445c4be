#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace redrive::db::model {

inline constexpr const char* kReplayStatusReplayed         = "replayed";
inline constexpr const char* kReplayStatusAlreadyProcessed = "already_processed";

// Keyed by (original_stream, original_msg_id).
struct ReplayLogRecord {
  std::string                original_stream;
  std::string                original_msg_id;
  std::string                dl_msg_id;
  std::optional<std::string> candidate_id;
  std::optional<std::string> idempotency_key;
  std::optional<std::string> new_msg_id;
  std::string                replayed_by;
  std::string                status = kReplayStatusReplayed;
  uint64_t                   replayed_at_ms = 0;
};

} // namespace redrive::db::model
