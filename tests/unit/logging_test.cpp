#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/config.pb.h"

namespace {

using redrive::observability::BoolField;
using redrive::observability::IntField;
using redrive::observability::StringField;

std::filesystem::path LogPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "redrive_logging_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".log");
  std::filesystem::remove(path);
  return path;
}

std::string ReadAll(const std::filesystem::path& path) {
  spdlog::default_logger()->flush();
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestJsonLinesToFile() {
  const auto path = LogPath("json");

  redrive::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_format("json");
  config.mutable_logging()->set_level("debug");
  config.mutable_logging()->set_file_path(path.string());
  redrive::observability::InitializeLogging(config);

  REDRIVE_LOG_INFO("Moved message", {StringField("msg_id", "42"), StringField("reason", "say \"hi\""), IntField("attempt", 3),
                                     BoolField("dry_run", false)});

  const auto content = ReadAll(path);
  assert(content.find(R"("level":"info")") != std::string::npos);
  assert(content.find(R"("msg":"Moved message","msg_id":"42","reason":"say \"hi\"","attempt":3,"dry_run":false})") != std::string::npos);
}

void TestTextFieldsAreQuotedWhenNeeded() {
  const auto path = LogPath("text");

  redrive::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_format("text");
  config.mutable_logging()->set_file_path(path.string());
  redrive::observability::InitializeLogging(config);

  REDRIVE_LOG_WARN("Ack failed", {StringField("msg_id", "7"), StringField("error", "connection reset")});
  REDRIVE_LOG_DEBUG("Below the level");

  const auto content = ReadAll(path);
  assert(content.find(R"(Ack failed msg_id=7 error="connection reset")") != std::string::npos);
  assert(content.find("Below the level") == std::string::npos);
}

} // namespace

int main() {
  for (const char* key : {"REDRIVE_LOG_LEVEL", "REDRIVE_LOG_PATTERN", "REDRIVE_LOG_FORMAT"}) {
    unsetenv(key);
  }

  TestJsonLinesToFile();
  TestTextFieldsAreQuotedWhenNeeded();
  redrive::observability::ShutdownLogging();
  std::cout << "redrive_unit_logging: pass\n";
  return 0;
}
