#pragma once

#include <string>

#include "config/config.pb.h"

namespace artifact::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Durations use the protobuf JSON form ("600s", "1.5s").
*/
class ConfigLoader {
 public:
  static artifact::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const artifact::runtime::config::RuntimeConfig& config);
};

} // namespace artifact::config
