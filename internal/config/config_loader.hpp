#pragma once

#include <string>

#include "config/config.pb.h"

namespace zget::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled in by ApplyDefaults, so callers always see a complete config.
*/
class ConfigLoader {
 public:
  static zget::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config used when no file is given.
  static zget::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(zget::runtime::config::RuntimeConfig& config);
};

} // namespace zget::config
