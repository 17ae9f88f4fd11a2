#pragma once

#include <string>

#include "config/config.pb.h"

namespace ragctx::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected. Defaults are applied and the result validated.
*/
class ConfigLoader {
 public:
  static ragctx::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ragctx::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Fills every unset field with its built-in default. Idempotent.
void ApplyDefaults(ragctx::runtime::config::RuntimeConfig& config);

// Throws std::runtime_error naming the first offending field.
void Validate(const ragctx::runtime::config::RuntimeConfig& config);

} // namespace ragctx::config
