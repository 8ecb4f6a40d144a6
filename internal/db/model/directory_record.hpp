#pragma once

#include <cstdint>
#include <string>

namespace draftstore::db::model {

/*
  Users and groups. Neither is ever physically removed; deletion is an
  append-only lock row, surfaced here as is_deleted.
*/

struct UserRecord {
  int64_t     user_id = 0; // 0 = assign on insert
  std::string username;
  uint64_t    created_on_ms = 0;
  bool        is_deleted    = false; // derived
};

struct GroupRecord {
  int64_t     group_id = 0; // 0 = assign on insert
  std::string name;
  int64_t     creator_id    = 0;
  uint64_t    created_on_ms = 0;
  bool        is_deleted    = false; // derived
};

} // namespace draftstore::db::model
