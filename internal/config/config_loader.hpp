#pragma once

#include <string>

#include "calltrace/config/v1/config.pb.h"

namespace calltrace::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the proto
  schema is the single definition of what a config file may contain.
  Unset sections are filled with defaults after parsing.
*/
class ConfigLoader {
 public:
  static calltrace::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static calltrace::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Config used when no file is given.
  static calltrace::runtime::config::RuntimeConfig Defaults();

  // Fills unset fields and rejects unknown enum-like values.
  static void ApplyDefaults(calltrace::runtime::config::RuntimeConfig& config);
};

} // namespace calltrace::config
