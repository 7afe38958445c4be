#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace redrive::db::model {

// Keyed by (dl_stream, dl_msg_id); ids restart at 1 in every stream.
struct DeadLetterArchiveRecord {
  std::string                dl_stream;
  std::string                dl_msg_id;
  std::string                original_msg_id;
  std::optional<std::string> candidate_id;
  std::string                payload_json;
  std::string                reason;
  std::string                dead_lettered_at;
  uint64_t                   archived_at_ms = 0;
  std::string                archived_by;
};

} // namespace redrive::db::model
