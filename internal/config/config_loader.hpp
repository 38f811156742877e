#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace workledger::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, then JSON, then parsed into
  RuntimeConfig. Unknown keys are rejected. Quoted scalars always stay
  strings.
*/
class ConfigLoader {
 public:
  static workledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static workledger::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

// Zero-valued fields resolved to their defaults.
uint32_t LockTimeoutSec(const workledger::runtime::config::RuntimeConfig& config);
uint32_t SweepIntervalSec(const workledger::runtime::config::RuntimeConfig& config);
uint32_t ContentBulkSize(const workledger::runtime::config::RuntimeConfig& config);

} // namespace workledger::config
