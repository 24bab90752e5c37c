#pragma once

#include <string>

#include "config/config.pb.h"

namespace tsbatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, then validated.
*/
class ConfigLoader {
 public:
  static tsbatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws util::InvalidArgument naming the first offending field.
  static void Validate(const tsbatch::runtime::config::RuntimeConfig& config);
};

} // namespace tsbatch::config
