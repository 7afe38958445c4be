#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using redrive::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "redrive_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnvironment() {
  for (const char* key : {"REDRIVE_STREAM_KEY", "REDRIVE_CONSUMER_NAME", "REDRIVE_STREAM_MAX_LEN", "REDRIVE_CLAIM_IDLE_MS",
                          "REDRIVE_DEAD_LETTER_STREAM", "REDRIVE_DEAD_LETTER_MAX_LEN", "REDRIVE_SQLITE_PATH"}) {
    unsetenv(key);
  }
}

void TestDefaultsWithoutYaml() {
  ClearEnvironment();
  setenv("REDRIVE_CONSUMER_NAME", "worker-a", 1);

  const auto config = ConfigLoader::Load("");
  assert(config.queue().stream_key() == "redrive:work");
  assert(config.queue().consumer_group() == "redrive-workers");
  assert(config.queue().consumer_name() == "worker-a");
  assert(config.queue().max_stream_length() == 100000);
  assert(config.queue().claim_idle_ms() == 300000);
  assert(config.queue().block_ms() == 2000);
  assert(config.queue().max_reclaim_attempts() == 3);
  assert(config.queue().max_reclaim_per_pass() == 20);
  assert(config.queue().base_backoff_ms() == 60000);
  assert(config.queue().max_backoff_ms() == 86400000);
  assert(config.queue().reclaim_attempts_ttl_sec() == 604800);
  assert(config.dead_letter().stream_key() == "redrive:work:dead-letter");
  assert(config.dead_letter().max_length() == 10000);
  assert(config.dead_letter().replay_tracking_ttl_sec() == 86400);
  assert(config.outbox().retry_base_ms() == 1000);
  assert(config.outbox().retry_max_exponent() == 10);
  assert(config.outbox().claim_timeout_ms() == 300000);
  assert(config.retention().outbox_days() == 30);
  assert(config.worker().worker_id() == "worker-a");
  assert(config.database().has_memory());

  ClearEnvironment();
}

void TestYamlValuesAreLoaded() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("yaml_values",
                                   R"(queue:
  stream_key: "jobs"
  consumer_group: "jobs-workers"
  consumer_name: "w1"
  max_reclaim_attempts: 5
dead_letter:
  max_length: 250
database:
  sqlite:
    path: "C:\\redrive\\\"quoted\"\\db.sqlite"
logging:
  level: "debug"
)");

  const auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.queue().stream_key() == "jobs");
  assert(config.queue().consumer_group() == "jobs-workers");
  assert(config.queue().max_reclaim_attempts() == 5);
  // Derived from the work stream when unset.
  assert(config.dead_letter().stream_key() == "jobs:dead-letter");
  assert(config.dead_letter().max_length() == 250);
  assert(config.database().sqlite().path() == "C:\\redrive\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.logging().level() == "debug");
}

void TestEnvironmentOverridesYaml() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("env_override",
                                   R"(queue:
  stream_key: "from-yaml"
  claim_idle_ms: 1000
)");

  setenv("REDRIVE_STREAM_KEY", "from-env", 1);
  setenv("REDRIVE_CLAIM_IDLE_MS", "4500", 1);
  setenv("REDRIVE_DEAD_LETTER_STREAM", "dlq", 1);

  const auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.queue().stream_key() == "from-env");
  assert(config.queue().claim_idle_ms() == 4500);
  assert(config.dead_letter().stream_key() == "dlq");

  ClearEnvironment();
}

void TestMalformedNumberIsConfigError() {
  ClearEnvironment();
  setenv("REDRIVE_STREAM_MAX_LEN", "12abc", 1);

  bool threw = false;
  try {
    (void)ConfigLoader::Load("");
  } catch (const redrive::util::ConfigError&) {
    threw = true;
  }
  assert(threw);

  setenv("REDRIVE_STREAM_MAX_LEN", "-5", 1);
  threw = false;
  try {
    (void)ConfigLoader::Load("");
  } catch (const redrive::util::ConfigError&) {
    threw = true;
  }
  assert(threw);

  ClearEnvironment();
}

void TestUnknownFieldsAreRejected() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(queue:
  stream_key: "jobs"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

} // namespace

int main() {
  TestDefaultsWithoutYaml();
  TestYamlValuesAreLoaded();
  TestEnvironmentOverridesYaml();
  TestMalformedNumberIsConfigError();
  TestUnknownFieldsAreRejected();

  std::cout << "redrive_unit_config_loader: pass\n";
  return 0;
}
