#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "draftstore/v1.hpp"

namespace draftstore::db::model {

/*
  Persistent draft row.

  payload is the JSON blob with exactly the keys
    resource_data, resource_id, resource_snapshot_id, base_resource_id
  and is the source of truth. resource_id / base_resource_id mirror the
  blob for backends that cannot query inside it; SQL backends read them
  back out of the blob.
*/
struct DraftRecord {
  int64_t                      draft_id      = 0; // 0 = assign on insert
  int64_t                      group_id      = 0;
  draftstore::v1::ResourceType resource_type = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  int64_t                      user_id       = 0;
  std::string                  payload;

  uint64_t created_on_ms       = 0;
  uint64_t last_modified_on_ms = 0;

  std::optional<int64_t> resource_id;
  std::optional<int64_t> base_resource_id;
};

} // namespace draftstore::db::model
