#pragma once

#include <cstdint>
#include <string>

namespace redrive::db::model {

struct StreamRecord {
  uint64_t    stream_id = 0;
  std::string name;
  uint64_t    created_at_ms = 0;
};

} // namespace redrive::db::model
