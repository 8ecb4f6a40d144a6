#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "draftstore/v1.hpp"

namespace draftstore::model {

using ResourceType     = draftstore::v1::ResourceType;
using ResourceLockType = draftstore::v1::ResourceLockType;

/*
  Text tags used in persisted rows and configuration
  ("queue", "entry_point", ...). The numeric enum never hits storage.
*/

std::string                 ResourceTypeTag(ResourceType type);
std::optional<ResourceType> ParseResourceTypeTag(std::string_view tag);

std::string                     LockTypeTag(ResourceLockType type);
std::optional<ResourceLockType> ParseLockTypeTag(std::string_view tag);

} // namespace draftstore::model
