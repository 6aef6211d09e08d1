#pragma once

#include <string>

#include "config/config.pb.h"

namespace avatarpool::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Required fields are checked after parsing.
*/
class ConfigLoader {
 public:
  static avatarpool::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static avatarpool::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Throws std::runtime_error naming the first missing or invalid field.
  static void Validate(const avatarpool::runtime::config::RuntimeConfig& config);
};

} // namespace avatarpool::config
