#include "dependency_rules.hpp"

#include <algorithm>

namespace draftstore::model {

using namespace draftstore::v1;

const std::vector<DependencyRule>& DefaultDependencyRules() {
  static const std::vector<DependencyRule> kRules = {
      {RESOURCE_TYPE_EXPERIMENT, RESOURCE_TYPE_ENTRY_POINT},
      {RESOURCE_TYPE_ENTRY_POINT, RESOURCE_TYPE_JOB},
      {RESOURCE_TYPE_ENTRY_POINT, RESOURCE_TYPE_QUEUE},
      {RESOURCE_TYPE_ENTRY_POINT, RESOURCE_TYPE_PLUGIN},
      {RESOURCE_TYPE_PLUGIN, RESOURCE_TYPE_PLUGIN_FILE},
      {RESOURCE_TYPE_JOB, RESOURCE_TYPE_ARTIFACT},
      {RESOURCE_TYPE_JOB, RESOURCE_TYPE_ML_MODEL},
  };
  return kRules;
}

bool IsLegalDependency(const std::vector<DependencyRule>& rules, ResourceType parent, ResourceType child) {
  return std::find(rules.begin(), rules.end(), DependencyRule{parent, child}) != rules.end();
}

} // namespace draftstore::model
