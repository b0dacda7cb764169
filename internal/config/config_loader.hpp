#pragma once

#include <string>

#include "config/config.pb.h"

namespace adrgen::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled from Defaults().
*/
class ConfigLoader {
 public:
  static adrgen::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static adrgen::runtime::config::RuntimeConfig Defaults();

  // Fills every empty / zero field with its default.
  static void ApplyDefaults(adrgen::runtime::config::RuntimeConfig* config);

  // ADRGEN_DIR overrides store.directory.
  static void ApplyEnvironment(adrgen::runtime::config::RuntimeConfig* config);
};

} // namespace adrgen::config
