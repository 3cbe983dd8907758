#pragma once

#include <string>

#include "config/config.pb.h"

namespace orchestrator::config {

/*
  RuntimeConfig from YAML, by way of protobuf JSON: unknown keys are
  rejected and durations are written "1.5s". Scalars may reference the
  environment as ${NAME} or ${NAME:-fallback}; quoted scalars are never
  coerced to numbers or booleans.
*/
class ConfigLoader {
 public:
  static orchestrator::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static orchestrator::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::invalid_argument naming the first bad field.
  static void Validate(const orchestrator::runtime::config::RuntimeConfig& config);
};

} // namespace orchestrator::config
