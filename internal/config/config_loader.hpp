#pragma once

#include <string>

#include "config/config.pb.h"

namespace seawatch::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, serialized to JSON and parsed
  into the generated message, so the .proto stays the single schema.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static seawatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static seawatch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace seawatch::config
