#pragma once

#include <string>

#include "config/config.pb.h"

namespace alarmsrv::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing optional settings get their defaults and the result
  is validated before it is returned. Errors throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static alarmsrv::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static alarmsrv::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace alarmsrv::config
