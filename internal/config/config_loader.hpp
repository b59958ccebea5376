#pragma once

#include <string>

#include "config/config.pb.h"

namespace chunkcam::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; missing keys are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static chunkcam::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(chunkcam::runtime::config::RuntimeConfig* config);
};

} // namespace chunkcam::config
