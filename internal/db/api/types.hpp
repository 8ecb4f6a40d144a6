#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "draftstore/v1.hpp"

namespace draftstore::db {

struct Pagination {
  std::size_t offset = 0;
  std::size_t limit  = 0; // 0 = unbounded
};

enum class DraftType {
  kAny,
  kResource,     // payload.resource_id is null
  kModification, // payload.resource_id is set
};

/*
  Draft row filter. Unset members do not constrain.
  Results are always ordered by draft_id ascending.
*/
struct DraftFilter {
  DraftType                                   draft_type = DraftType::kAny;
  std::optional<draftstore::v1::ResourceType> resource_type;
  std::optional<int64_t>                      user_id;
  std::optional<int64_t>                      exclude_user_id;
  std::optional<int64_t>                      group_id;
  std::optional<int64_t>                      resource_id;
  std::optional<int64_t>                      base_resource_id;
};

// One-pass view of a prospective parent resource.
struct ParentTypeCheck {
  bool                         is_deleted = false;
  draftstore::v1::ResourceType parent_type = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  bool                         legal = false; // (parent_type, child) is a declared pair
};

} // namespace draftstore::db
