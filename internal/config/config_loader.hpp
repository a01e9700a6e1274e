#pragma once

#include <string>

#include "config/config.pb.h"

namespace ingest::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  an error. Values left unset are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static ingest::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static ingest::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void ApplyDefaults(ingest::runtime::config::RuntimeConfig& config);
};

} // namespace ingest::config
