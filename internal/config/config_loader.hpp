#pragma once

#include <string>

#include "config/config.pb.h"

namespace dispatch::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, serialized to JSON and parsed
  into RuntimeConfig. Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static dispatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static dispatch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace dispatch::config
