#include "resource_type.hpp"

#include <array>
#include <utility>

namespace draftstore::model {
namespace {

using namespace draftstore::v1;

constexpr std::array<std::pair<ResourceType, std::string_view>, 9> kResourceTags = {{
    {RESOURCE_TYPE_QUEUE, "queue"},
    {RESOURCE_TYPE_EXPERIMENT, "experiment"},
    {RESOURCE_TYPE_ENTRY_POINT, "entry_point"},
    {RESOURCE_TYPE_JOB, "job"},
    {RESOURCE_TYPE_PLUGIN, "plugin"},
    {RESOURCE_TYPE_PLUGIN_FILE, "plugin_file"},
    {RESOURCE_TYPE_PLUGIN_TASK_PARAMETER_TYPE, "plugin_task_parameter_type"},
    {RESOURCE_TYPE_ARTIFACT, "artifact"},
    {RESOURCE_TYPE_ML_MODEL, "ml_model"},
}};

constexpr std::array<std::pair<ResourceLockType, std::string_view>, 2> kLockTags = {{
    {RESOURCE_LOCK_TYPE_DELETE, "delete"},
    {RESOURCE_LOCK_TYPE_READONLY, "readonly"},
}};

} // namespace

std::string ResourceTypeTag(ResourceType type) {
  for (const auto& [value, tag] : kResourceTags) {
    if (value == type) return std::string(tag);
  }
  return "unspecified";
}

std::optional<ResourceType> ParseResourceTypeTag(std::string_view tag) {
  for (const auto& [value, name] : kResourceTags) {
    if (name == tag) return value;
  }
  return std::nullopt;
}

std::string LockTypeTag(ResourceLockType type) {
  for (const auto& [value, tag] : kLockTags) {
    if (value == type) return std::string(tag);
  }
  return "unspecified";
}

std::optional<ResourceLockType> ParseLockTypeTag(std::string_view tag) {
  for (const auto& [value, name] : kLockTags) {
    if (name == tag) return value;
  }
  return std::nullopt;
}

} // namespace draftstore::model
