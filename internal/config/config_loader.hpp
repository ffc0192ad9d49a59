#pragma once

#include <string>

#include "config/config.pb.h"

namespace meshdispatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset fields are filled by ApplyDefaults and the result is
  checked by Validate; both throw std::runtime_error on bad input.
*/
class ConfigLoader {
 public:
  static meshdispatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static meshdispatch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(meshdispatch::runtime::config::RuntimeConfig& config);
  static void Validate(const meshdispatch::runtime::config::RuntimeConfig& config);
};

} // namespace meshdispatch::config
