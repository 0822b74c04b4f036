#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"

namespace coord::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected and durations use the protobuf form ("600s").
*/
class ConfigLoader {
 public:
  static coord::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Explicit path: must exist. No path: ./coordinator.yaml when present,
  // built-in defaults otherwise. Defaults are applied and the result
  // validated in both cases.
  static coord::runtime::config::RuntimeConfig Load(const std::optional<std::string>& path);

  // Fills unset store/server/projects fields. Coordination durations and
  // limits default in core::CoordinatorOptions.
  static void ApplyDefaults(coord::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the first offending key.
  static void Validate(const coord::runtime::config::RuntimeConfig& config);

  // Indented JSON with proto field names, as printed by coordd --check-config.
  static std::string ToJson(const coord::runtime::config::RuntimeConfig& config);
};

} // namespace coord::config
