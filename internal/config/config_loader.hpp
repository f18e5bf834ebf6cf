#pragma once

#include <string>

#include "config/config.pb.h"

namespace localdisk::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static localdisk::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace localdisk::config
