#pragma once

#include <vector>

#include "internal/model/resource_type.hpp"

namespace draftstore::model {

/*
  Legal (parent_type, child_type) pairs.

  The rule table is owned by configuration and seeded into the store at
  bootstrap; validation always queries the store copy.
*/
struct DependencyRule {
  ResourceType parent = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  ResourceType child  = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;

  bool operator==(const DependencyRule&) const = default;
};

// experiment -> entry_point -> {job, queue, plugin}, plugin -> plugin_file,
// job -> {artifact, ml_model}. Jobs never attach to experiments directly.
const std::vector<DependencyRule>& DefaultDependencyRules();

bool IsLegalDependency(const std::vector<DependencyRule>& rules, ResourceType parent, ResourceType child);

} // namespace draftstore::model
