#pragma once

#include <string>

#include "config/config.pb.h"

namespace mprisrelay::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static mprisrelay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config from `path` when non-empty, else from the per-user default
  // location when that file exists, else built-in defaults. Defaults are
  // always applied and the result validated.
  static mprisrelay::runtime::config::RuntimeConfig Load(const std::string& path);

  // Fills every unset field with its built-in default.
  static void ApplyDefaults(mprisrelay::runtime::config::RuntimeConfig* config);

  // Throws std::runtime_error on out-of-range values.
  static void Validate(const mprisrelay::runtime::config::RuntimeConfig& config);
};

} // namespace mprisrelay::config
