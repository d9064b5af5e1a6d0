#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleetwatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Defaults are
  filled in and the result is validated; any problem throws
  util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static fleetwatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace fleetwatch::config
