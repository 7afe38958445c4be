#pragma once

#include <string>

#include "internal/db/model/stream_entry_record.hpp"

namespace redrive::db::sql {

/*
  Stream entry fields are persisted as a flat JSON object of strings.

  Encoding goes through google.protobuf.Struct so every backend shares
  the same canonical form.
*/

std::string EncodeFields(const model::FieldMap& fields);

// Throws std::runtime_error on malformed input or non-string values.
model::FieldMap DecodeFields(const std::string& json);

} // namespace redrive::db::sql
