#pragma once

#include <string>

#include "config/config.pb.h"

namespace optimist::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Missing values are filled with the harness defaults and the
  result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static optimist::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static optimist::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset durations/enums with defaults. Idempotent.
  static void ApplyDefaults(optimist::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid value.
  static void Validate(const optimist::runtime::config::RuntimeConfig& config);
};

} // namespace optimist::config
