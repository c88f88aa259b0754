#pragma once

#include <string>

#include "config/config.pb.h"

namespace epg::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static epg::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset fields with the service defaults. Idempotent.
  static void ApplyDefaults(epg::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const epg::runtime::config::RuntimeConfig& config);
};

} // namespace epg::config
