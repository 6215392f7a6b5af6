#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace graphflow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Unset sections are filled with defaults afterwards.
*/
class ConfigLoader {
 public:
  static graphflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static graphflow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(graphflow::runtime::config::RuntimeConfig& config);
};

inline constexpr const char*   kDefaultBindAddress  = "0.0.0.0:50061";
inline constexpr std::uint64_t kDefaultMaxWorkItems = 100000;

} // namespace graphflow::config
