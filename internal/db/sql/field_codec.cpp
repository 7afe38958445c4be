#include "internal/db/sql/field_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace redrive::db::sql {

std::string EncodeFields(const model::FieldMap& fields) {
  google::protobuf::Struct message;
  auto&                    out = *message.mutable_fields();
  for (const auto& [key, value] : fields) {
    out[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode stream fields: " + std::string(status.message()));
  }
  return json;
}

model::FieldMap DecodeFields(const std::string& json) {
  model::FieldMap fields;
  if (json.empty()) {
    return fields;
  }

  google::protobuf::Struct message;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw std::runtime_error("failed to decode stream fields: " + std::string(status.message()));
  }

  for (const auto& [key, value] : message.fields()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw std::runtime_error("stream field '" + key + "' is not a string");
    }
    fields.emplace(key, value.string_value());
  }
  return fields;
}

} // namespace redrive::db::sql
