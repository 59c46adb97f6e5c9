#pragma once

#include <string>

#include "config/config.pb.h"

namespace routebroker::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults are filled in for unset fields and the result is
  validated before it is returned.
*/
class ConfigLoader {
 public:
  static routebroker::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static routebroker::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(routebroker::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid setting.
  static void Validate(const routebroker::runtime::config::RuntimeConfig& config);
};

} // namespace routebroker::config
