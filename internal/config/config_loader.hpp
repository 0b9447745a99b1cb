#pragma once

#include <string>

#include "config/config.pb.h"

namespace codestaff::config {

inline constexpr uint32_t kDefaultQueueCapacity = 2048;
inline constexpr uint32_t kDefaultCookieCeiling = 2;
inline constexpr uint32_t kDefaultBusCapacity   = 32;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset numeric
  fields receive the defaults above (cookie_ceiling only when absent, 0 is
  kept); a missing database path is an error.
*/
class ConfigLoader {
 public:
  static codestaff::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(codestaff::runtime::config::RuntimeConfig& config);
};

} // namespace codestaff::config
