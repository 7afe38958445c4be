#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace redrive::observability {
namespace {

constexpr const char* kLoggerName   = "redrive";
constexpr const char* kTextPattern  = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr const char* kJsonPattern  = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l",%v})";
constexpr uint32_t    kDefaultMaxMb = 64;
constexpr uint32_t    kDefaultFiles = 5;

std::atomic<bool> g_json{false};

std::string FromEnvOr(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

void AppendJsonString(std::string& out, std::string_view value) {
  out.push_back('"');
  for (const char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static constexpr char kHex[] = "0123456789abcdef";
          out += "\\u00";
          out.push_back(kHex[(c >> 4) & 0x0F]);
          out.push_back(kHex[c & 0x0F]);
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

// Values with spaces, quotes or '=' are quoted so key=value stays parseable.
void AppendTextValue(std::string& out, std::string_view value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string_view::npos) {
    out.append(value);
    return;
  }
  AppendJsonString(out, value);
}

std::string FormatText(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);
  for (const auto& field : fields) {
    out.push_back(' ');
    out += field.key;
    out.push_back('=');
    AppendTextValue(out, field.value);
  }
  return out;
}

// Body of a JSON object; the pattern supplies the braces, ts and level.
std::string FormatJson(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out = "\"msg\":";
  AppendJsonString(out, message);
  for (const auto& field : fields) {
    out.push_back(',');
    AppendJsonString(out, field.key);
    out.push_back(':');
    if (field.raw) {
      out += field.value;
    } else {
      AppendJsonString(out, field.value);
    }
  }
  return out;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value), false};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value), true};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false", true};
}

void InitializeLogging(const redrive::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  const bool json = FromEnvOr("REDRIVE_LOG_FORMAT", logging.format(), "text") == "json";
  g_json.store(json);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!logging.file_path().empty()) {
    const auto max_mb    = logging.file_max_mb() == 0 ? kDefaultMaxMb : logging.file_max_mb();
    const auto max_files = logging.file_max_files() == 0 ? kDefaultFiles : logging.file_max_files();
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file_path(), static_cast<std::size_t>(max_mb) * 1024 * 1024,
                                                                           static_cast<std::size_t>(max_files)));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(json ? kJsonPattern : FromEnvOr("REDRIVE_LOG_PATTERN", logging.pattern(), kTextPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("REDRIVE_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) {
    return;
  }
  const auto line = g_json.load() ? FormatJson(message, fields) : FormatText(message, fields);
  spdlog::log(level, "{}", line);
}

} // namespace redrive::observability
