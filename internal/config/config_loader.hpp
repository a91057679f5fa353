#pragma once

#include <string>

#include "config/config.pb.h"

namespace ito::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected so typos surface instead of silently falling back to defaults.
*/
class ConfigLoader {
 public:
  static ito::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ito::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace ito::config
