#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace redrive::db::model {

/*
  Side-effect delivery task.

  process_after_ms is the only retry-scheduling field.
  claimed_by / claimed_at_ms mark ownership while a processor holds it.
*/
struct OutboxRecord {
  uint64_t                   id = 0;
  std::string                aggregate_type;
  std::string                aggregate_id;
  std::string                event_kind;
  std::string                payload_json;
  uint64_t                   created_at_ms = 0;
  std::optional<uint64_t>    processed_at_ms;
  std::optional<std::string> processed_by;
  uint32_t                   retry_count      = 0;
  uint64_t                   process_after_ms = 0;
  std::optional<std::string> claimed_by;
  std::optional<uint64_t>    claimed_at_ms;
  std::string                last_error;
};

} // namespace redrive::db::model
