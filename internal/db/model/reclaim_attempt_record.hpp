#pragma once

#include <cstdint>

namespace redrive::db::model {

struct ReclaimAttemptRecord {
  uint64_t stream_id     = 0;
  uint64_t offset        = 0;
  uint64_t attempts      = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace redrive::db::model
