#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace redrive::db::model {

using FieldMap = std::map<std::string, std::string>;

/*
  One entry of an append-only stream.

  `dedupe_key` is optional (empty = none); when set it is unique per
  stream, which lets a writer append "at most once" for a logical key.
*/
struct StreamEntryRecord {
  uint64_t    stream_id = 0;
  uint64_t    offset    = 0;
  FieldMap    fields;
  std::string dedupe_key;
  uint64_t    append_time_ms = 0;
};

} // namespace redrive::db::model
