#pragma once

#include <string>

#include "config/config.pb.h"

namespace taskorch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected; zero values mean "use the default".
*/
class ConfigLoader {
 public:
  static taskorch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Structural checks protobuf cannot express (unique queue names,
  // triggers pointing at declared queues, ...). Throws std::runtime_error.
  static void Validate(const taskorch::runtime::config::RuntimeConfig& config);
};

} // namespace taskorch::config
