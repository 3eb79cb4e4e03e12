#pragma once

#include <string>

#include "config/config.pb.h"

namespace asqueue::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static asqueue::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills defaults and rejects unusable values (throws std::runtime_error).
  static void Validate(asqueue::runtime::config::RuntimeConfig& config);
};

} // namespace asqueue::config
