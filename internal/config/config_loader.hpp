#pragma once

#include <string>

#include "config/config.pb.h"

namespace healthd::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Durations use the
  protobuf JSON form, e.g. retention_period: "259200s".
*/
class ConfigLoader {
 public:
  static healthd::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset durations with the defaults below.
  static void ApplyDefaults(healthd::runtime::config::RuntimeConfig* config);

  // Throws util::InvalidArgument describing the first invalid field.
  static void Validate(const healthd::runtime::config::RuntimeConfig& config);
};

} // namespace healthd::config
