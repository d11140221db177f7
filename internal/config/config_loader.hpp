#pragma once

#include <string>

#include "config/config.pb.h"

namespace stockroom::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  mistyped values are rejected by the protobuf JSON parser. Quoted scalars
  always stay strings ("0042" is a tenant id, not a number).

  After parsing, defaults are filled in and the result is validated; a
  config that would start a broken store throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static stockroom::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static stockroom::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Memory backend, "default" tenant, threshold 5, "Restored" category.
  static void ApplyDefaults(stockroom::runtime::config::RuntimeConfig& config);
  static void Validate(const stockroom::runtime::config::RuntimeConfig& config);
};

} // namespace stockroom::config
