#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace redrive::runtime::config {
class RuntimeConfig;
}

namespace redrive::observability {

struct LogField {
  std::string key;
  std::string value;
  // Emitted unquoted in JSON output (numbers, booleans).
  bool raw = false;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "redrive" logger as spdlog's default.

  REDRIVE_LOG_LEVEL / REDRIVE_LOG_PATTERN / REDRIVE_LOG_FORMAT override
  the config. Until this runs, logging goes to spdlog's stock logger in
  text format.
*/
void InitializeLogging(const redrive::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace redrive::observability

#define REDRIVE_LOG_DEBUG(message, ...) ::redrive::observability::LogDebug((message), ##__VA_ARGS__)
#define REDRIVE_LOG_INFO(message, ...) ::redrive::observability::LogInfo((message), ##__VA_ARGS__)
#define REDRIVE_LOG_WARN(message, ...) ::redrive::observability::LogWarn((message), ##__VA_ARGS__)
#define REDRIVE_LOG_ERROR(message, ...) ::redrive::observability::LogError((message), ##__VA_ARGS__)
