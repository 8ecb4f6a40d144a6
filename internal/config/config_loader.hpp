#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/dependency_rules.hpp"

namespace draftstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Environment
  overrides (DRAFTSTORE_SQLITE_PATH) are applied after parsing, then the
  result is validated. Any failure throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static draftstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static draftstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void Validate(const draftstore::runtime::config::RuntimeConfig& config);

  // Configured rule table, or the built-in one when none is configured.
  static std::vector<model::DependencyRule> DependencyRules(const draftstore::runtime::config::RuntimeConfig& config);
};

} // namespace draftstore::config
