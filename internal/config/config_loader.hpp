#pragma once

#include <string>

#include "config/config.pb.h"

namespace redrive::config {

/*
  Loads RuntimeConfig.

  Resolution order: YAML file (optional), then REDRIVE_* environment
  overrides, then built-in defaults for anything still unset.

  YAML is converted to JSON then parsed into protobuf; unknown keys
  are rejected.
*/
class ConfigLoader {
 public:
  static redrive::runtime::config::RuntimeConfig Load(const std::string& yaml_path);

  static redrive::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyEnvironment(redrive::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(redrive::runtime::config::RuntimeConfig& config);
};

} // namespace redrive::config
