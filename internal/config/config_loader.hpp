#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/db/model/property_record.hpp"

namespace resync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, zero values receive defaults and every property is validated,
  so a bad rollover setting fails here and never at rollover time.

  All failures throw util::ConfigError.
*/
class ConfigLoader {
 public:
  static resync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same pipeline over an in-memory document.
  static resync::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(resync::runtime::config::RuntimeConfig& config);
  static void Validate(const resync::runtime::config::RuntimeConfig& config);
};

// Defaults applied; rollover_mode "auto" / "manual" mapped to the enum.
db::model::PropertyRecord PropertyFromConfig(const resync::runtime::config::PropertyConfig& property);

} // namespace resync::config
