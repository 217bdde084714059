#pragma once

#include <string>

#include "config/config.pb.h"

namespace slotwatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Keys may be written
  in snake_case or lowerCamelCase; unknown keys are ignored.
*/
class ConfigLoader {
 public:
  static slotwatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static slotwatch::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Fills every value that is absent or zero with its default.
  static void ApplyDefaults(slotwatch::runtime::config::RuntimeConfig& config);
};

} // namespace slotwatch::config
