#pragma once

#include <string>

#include "config/config.pb.h"

namespace planner::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Defaults are applied after parsing.
*/
class ConfigLoader {
 public:
  static planner::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config used when the daemon starts without a config file.
  static planner::runtime::config::RuntimeConfig Defaults();
};

// Fills every unset field with its documented default. Idempotent.
void ApplyDefaults(planner::runtime::config::RuntimeConfig* config);

} // namespace planner::config
