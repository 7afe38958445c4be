#pragma once

#include <cstdint>
#include <string>

namespace redrive::db::model {

struct LockRecord {
  std::string lock_name;
  std::string holder_id;
  uint64_t    acquired_at_ms = 0;
  uint64_t    expires_at_ms  = 0;
};

} // namespace redrive::db::model
