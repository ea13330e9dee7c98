#pragma once

#include <string>

#include "config/config.pb.h"

namespace aff4::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Missing sections fall back to the defaults applied by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static aff4::store::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static aff4::store::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(aff4::store::config::RuntimeConfig& config);
};

} // namespace aff4::config
