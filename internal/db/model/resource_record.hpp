#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "draftstore/v1.hpp"

namespace draftstore::db::model {

/*
  Persistent resource row.

  IMPORTANT:
  - is_deleted / is_readonly are derived from resource_locks and are
    ignored on insert.
  - latest_snapshot_id is only written by InsertSnapshot.
*/
struct ResourceRecord {
  int64_t                    resource_id = 0; // 0 = assign on insert
  int64_t                    group_id    = 0;
  draftstore::v1::ResourceType resource_type = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  uint64_t                   created_on_ms = 0;

  std::optional<int64_t> latest_snapshot_id;

  bool is_deleted  = false;
  bool is_readonly = false;
};

// Immutable once written.
struct SnapshotRecord {
  int64_t                      snapshot_id   = 0; // 0 = assign on insert
  int64_t                      resource_id   = 0;
  draftstore::v1::ResourceType resource_type = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  int64_t                      user_id       = 0;
  std::string                  description;
  std::string                  data; // JSON object
  uint64_t                     created_on_ms = 0;
};

struct LockRecord {
  int64_t                          resource_id = 0;
  draftstore::v1::ResourceLockType lock_type   = draftstore::v1::RESOURCE_LOCK_TYPE_UNSPECIFIED;
  uint64_t                         created_on_ms = 0;
};

} // namespace draftstore::db::model
