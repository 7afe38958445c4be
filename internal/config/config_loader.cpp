#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include "internal/util/errors.hpp"

namespace redrive::config {

using redrive::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Environment overrides
// ------------------------------------------------------------

namespace {

const char* Env(const char* key) {
  const char* value = std::getenv(key);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

uint64_t ParseUnsigned(const char* key, const char* raw) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stoull(raw, &consumed);
    if (consumed != std::string(raw).size() || std::string(raw).front() == '-') {
      throw std::invalid_argument(raw);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw util::ConfigError(std::string("Invalid numeric value for ") + key + ": " + raw);
  }
}

template <typename Setter>
void OverrideString(const char* key, Setter&& set) {
  if (const char* value = Env(key)) {
    set(std::string(value));
  }
}

template <typename Setter>
void OverrideUnsigned(const char* key, Setter&& set) {
  if (const char* value = Env(key)) {
    set(ParseUnsigned(key, value));
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  auto* queue = config.mutable_queue();
  auto* dl    = config.mutable_dead_letter();

  OverrideString("REDRIVE_STREAM_KEY", [&](std::string v) { queue->set_stream_key(std::move(v)); });
  OverrideString("REDRIVE_CONSUMER_GROUP", [&](std::string v) { queue->set_consumer_group(std::move(v)); });
  OverrideString("REDRIVE_CONSUMER_NAME", [&](std::string v) { queue->set_consumer_name(std::move(v)); });
  OverrideUnsigned("REDRIVE_STREAM_MAX_LEN", [&](uint64_t v) { queue->set_max_stream_length(v); });
  OverrideUnsigned("REDRIVE_CLAIM_IDLE_MS", [&](uint64_t v) { queue->set_claim_idle_ms(v); });
  OverrideUnsigned("REDRIVE_BLOCK_MS", [&](uint64_t v) { queue->set_block_ms(v); });
  OverrideUnsigned("REDRIVE_MAX_RECLAIM_ATTEMPTS", [&](uint64_t v) { queue->set_max_reclaim_attempts(static_cast<uint32_t>(v)); });
  OverrideUnsigned("REDRIVE_MAX_RECLAIM_PER_PASS", [&](uint64_t v) { queue->set_max_reclaim_per_pass(static_cast<uint32_t>(v)); });
  OverrideUnsigned("REDRIVE_RECLAIM_BASE_BACKOFF_MS", [&](uint64_t v) { queue->set_base_backoff_ms(v); });
  OverrideUnsigned("REDRIVE_RECLAIM_MAX_BACKOFF_MS", [&](uint64_t v) { queue->set_max_backoff_ms(v); });
  OverrideUnsigned("REDRIVE_RECLAIM_ATTEMPTS_TTL", [&](uint64_t v) { queue->set_reclaim_attempts_ttl_sec(v); });

  OverrideString("REDRIVE_DEAD_LETTER_STREAM", [&](std::string v) { dl->set_stream_key(std::move(v)); });
  OverrideUnsigned("REDRIVE_DEAD_LETTER_MAX_LEN", [&](uint64_t v) { dl->set_max_length(v); });
  OverrideUnsigned("REDRIVE_REPLAY_TRACKING_TTL", [&](uint64_t v) { dl->set_replay_tracking_ttl_sec(v); });

  OverrideString("REDRIVE_DATABASE_URL", [&](std::string v) { config.mutable_database()->mutable_postgres()->set_connection_uri(std::move(v)); });
  OverrideString("REDRIVE_SQLITE_PATH", [&](std::string v) { config.mutable_database()->mutable_sqlite()->set_path(std::move(v)); });
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* queue = config.mutable_queue();
  if (queue->stream_key().empty()) queue->set_stream_key("redrive:work");
  if (queue->consumer_group().empty()) queue->set_consumer_group("redrive-workers");
  if (queue->consumer_name().empty()) {
    const char* host = std::getenv("HOSTNAME");
    queue->set_consumer_name(host != nullptr && *host != '\0' ? std::string(host) : "worker-" + std::to_string(::getpid()));
  }
  if (queue->max_stream_length() == 0) queue->set_max_stream_length(100000);
  if (queue->claim_idle_ms() == 0) queue->set_claim_idle_ms(300000);
  if (queue->block_ms() == 0) queue->set_block_ms(2000);
  if (queue->max_reclaim_attempts() == 0) queue->set_max_reclaim_attempts(3);
  if (queue->max_reclaim_per_pass() == 0) queue->set_max_reclaim_per_pass(20);
  if (queue->pending_scan_limit() == 0) queue->set_pending_scan_limit(100);
  if (queue->base_backoff_ms() == 0) queue->set_base_backoff_ms(60000);
  if (queue->max_backoff_ms() == 0) queue->set_max_backoff_ms(86400000);
  if (queue->reclaim_attempts_ttl_sec() == 0) queue->set_reclaim_attempts_ttl_sec(604800);

  auto* dl = config.mutable_dead_letter();
  if (dl->stream_key().empty()) dl->set_stream_key(queue->stream_key() + ":dead-letter");
  if (dl->max_length() == 0) dl->set_max_length(10000);
  if (dl->replay_tracking_ttl_sec() == 0) dl->set_replay_tracking_ttl_sec(86400);
  if (dl->replay_batch_size() == 0) dl->set_replay_batch_size(100);
  if (dl->max_replays() == 0) dl->set_max_replays(1000);

  auto* outbox = config.mutable_outbox();
  if (outbox->processor_id().empty()) outbox->set_processor_id(queue->consumer_name());
  if (outbox->batch_size() == 0) outbox->set_batch_size(10);
  if (outbox->claim_timeout_ms() == 0) outbox->set_claim_timeout_ms(300000);
  if (outbox->retry_base_ms() == 0) outbox->set_retry_base_ms(1000);
  if (outbox->retry_max_exponent() == 0) outbox->set_retry_max_exponent(10);

  auto* retention = config.mutable_retention();
  if (retention->dead_letter_archive_days() == 0) retention->set_dead_letter_archive_days(30);
  if (retention->replay_log_days() == 0) retention->set_replay_log_days(30);
  if (retention->outbox_days() == 0) retention->set_outbox_days(30);

  auto* worker = config.mutable_worker();
  if (worker->worker_id().empty()) worker->set_worker_id(queue->consumer_name());
  if (worker->maintenance_interval_ms() == 0) worker->set_maintenance_interval_ms(60000);
  if (worker->lock_ttl_ms() == 0) worker->set_lock_ttl_ms(600000);
  if (worker->task_deadline_ms() == 0) worker->set_task_deadline_ms(300000);

  if (!config.has_database()) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite() && config.database().sqlite().busy_timeout_ms() == 0) {
    config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(5000);
  }
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }
}

RuntimeConfig ConfigLoader::Load(const std::string& yaml_path) {
  RuntimeConfig config;
  if (!yaml_path.empty()) {
    config = LoadFromYaml(yaml_path);
  }
  ApplyEnvironment(config);
  ApplyDefaults(config);
  return config;
}

} // namespace redrive::config
