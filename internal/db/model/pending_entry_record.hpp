#pragma once

#include <cstdint>
#include <string>

namespace redrive::db::model {

struct PendingEntryRecord {
  uint64_t    stream_id = 0;
  std::string group_name;
  uint64_t    offset = 0;
  std::string consumer;
  uint64_t    delivered_at_ms = 0;
  uint64_t    delivery_count  = 0;
};

} // namespace redrive::db::model
