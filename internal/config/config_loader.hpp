#pragma once

#include <string>

#include "config/config.pb.h"

namespace fieldgate::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Missing sections are filled with defaults by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static fieldgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fill zero-valued knobs with the shipped defaults.
  static void ApplyDefaults(fieldgate::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidConfig on values the pipeline cannot run with.
  static void Validate(const fieldgate::runtime::config::RuntimeConfig& config);
};

} // namespace fieldgate::config
