#include "internal/model/dependency_rules.hpp"

#include <cassert>
#include <iostream>

#include "internal/model/resource_type.hpp"

namespace {

namespace dm = draftstore::model;
using namespace draftstore::v1;

void TestDefaultTableShape() {
  const auto& rules = dm::DefaultDependencyRules();
  assert(rules.size() == 7);

  assert(dm::IsLegalDependency(rules, RESOURCE_TYPE_EXPERIMENT, RESOURCE_TYPE_ENTRY_POINT));
  assert(dm::IsLegalDependency(rules, RESOURCE_TYPE_ENTRY_POINT, RESOURCE_TYPE_JOB));
  assert(dm::IsLegalDependency(rules, RESOURCE_TYPE_ENTRY_POINT, RESOURCE_TYPE_QUEUE));
  assert(dm::IsLegalDependency(rules, RESOURCE_TYPE_PLUGIN, RESOURCE_TYPE_PLUGIN_FILE));
  assert(dm::IsLegalDependency(rules, RESOURCE_TYPE_JOB, RESOURCE_TYPE_ML_MODEL));
}

void TestIllegalPairs() {
  const auto& rules = dm::DefaultDependencyRules();

  // jobs attach through entry points
  assert(!dm::IsLegalDependency(rules, RESOURCE_TYPE_EXPERIMENT, RESOURCE_TYPE_JOB));
  assert(!dm::IsLegalDependency(rules, RESOURCE_TYPE_QUEUE, RESOURCE_TYPE_EXPERIMENT));
  // direction matters
  assert(!dm::IsLegalDependency(rules, RESOURCE_TYPE_ENTRY_POINT, RESOURCE_TYPE_EXPERIMENT));
  assert(!dm::IsLegalDependency({}, RESOURCE_TYPE_EXPERIMENT, RESOURCE_TYPE_ENTRY_POINT));
}

void TestTypeTags() {
  assert(dm::ResourceTypeTag(RESOURCE_TYPE_ENTRY_POINT) == "entry_point");
  assert(dm::ParseResourceTypeTag("plugin_task_parameter_type") == RESOURCE_TYPE_PLUGIN_TASK_PARAMETER_TYPE);
  assert(dm::ParseResourceTypeTag("ml_model") == RESOURCE_TYPE_ML_MODEL);
  assert(!dm::ParseResourceTypeTag("Queue").has_value());
  assert(!dm::ParseResourceTypeTag("").has_value());

  assert(dm::LockTypeTag(RESOURCE_LOCK_TYPE_READONLY) == "readonly");
  assert(dm::ParseLockTypeTag("delete") == RESOURCE_LOCK_TYPE_DELETE);
  assert(!dm::ParseLockTypeTag("archive").has_value());
}

} // namespace

int main() {
  TestDefaultTableShape();
  TestIllegalPairs();
  TestTypeTags();

  std::cout << "draftstore_unit_dependency_rules: pass\n";
  return 0;
}
