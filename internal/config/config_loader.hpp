#pragma once

#include <string>

#include "config/config.pb.h"

namespace connstate::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static connstate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static connstate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace connstate::config
