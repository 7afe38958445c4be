#pragma once

#include <cstdint>
#include <string>

namespace redrive::db::model {

// Cursor of a consumer group: every offset at or below last_delivered_offset has been handed out.
// Offsets start at 1, so 0 means nothing delivered yet.
struct ConsumerGroupRecord {
  uint64_t    stream_id = 0;
  std::string group_name;
  uint64_t    last_delivered_offset = 0;
  uint64_t    created_at_ms         = 0;
};

} // namespace redrive::db::model
