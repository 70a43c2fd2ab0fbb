#pragma once

#include <string>

#include "config/config.pb.h"

namespace coolrouter::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars always stay strings, so hex identities such
  as "0011..." are never read as numbers.
*/
class ConfigLoader {
 public:
  static coolrouter::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static coolrouter::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Fills bind address, database backend and queue depth when unset.
  static void ApplyDefaults(coolrouter::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the first invalid field.
  static void Validate(const coolrouter::runtime::config::RuntimeConfig& config);
};

} // namespace coolrouter::config
