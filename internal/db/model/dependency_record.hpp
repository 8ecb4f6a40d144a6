#pragma once

#include <cstdint>

#include "draftstore/v1.hpp"

namespace draftstore::db::model {

// Row of the legal-pair table.
struct DependencyTypeRecord {
  draftstore::v1::ResourceType parent_resource_type = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  draftstore::v1::ResourceType child_resource_type  = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
};

// Concrete parent -> child edge between two resources.
struct DependencyRecord {
  int64_t                      parent_resource_id   = 0;
  int64_t                      child_resource_id    = 0;
  draftstore::v1::ResourceType parent_resource_type = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  draftstore::v1::ResourceType child_resource_type  = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
};

} // namespace draftstore::db::model
