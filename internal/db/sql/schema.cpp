#include "schema.hpp"

namespace draftstore::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS users (user_id INTEGER PRIMARY KEY AUTOINCREMENT, username TEXT NOT NULL UNIQUE, created_on_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS user_locks (user_id INTEGER NOT NULL REFERENCES users(user_id), lock_type TEXT NOT NULL, created_on_ms INTEGER NOT NULL, PRIMARY KEY (user_id, lock_type));",
      "CREATE TABLE IF NOT EXISTS user_groups (group_id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, creator_id INTEGER NOT NULL REFERENCES users(user_id), created_on_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS group_locks (group_id INTEGER NOT NULL REFERENCES user_groups(group_id), lock_type TEXT NOT NULL, created_on_ms INTEGER NOT NULL, PRIMARY KEY (group_id, lock_type));",
      "CREATE TABLE IF NOT EXISTS group_members (group_id INTEGER NOT NULL REFERENCES user_groups(group_id), user_id INTEGER NOT NULL REFERENCES users(user_id), PRIMARY KEY (group_id, user_id));",
      "CREATE TABLE IF NOT EXISTS resources (resource_id INTEGER PRIMARY KEY AUTOINCREMENT, group_id INTEGER NOT NULL REFERENCES user_groups(group_id), resource_type TEXT NOT NULL, created_on_ms INTEGER NOT NULL, latest_snapshot_id INTEGER);",
      "CREATE TABLE IF NOT EXISTS resource_snapshots (resource_snapshot_id INTEGER PRIMARY KEY AUTOINCREMENT, resource_id INTEGER NOT NULL REFERENCES resources(resource_id), resource_type TEXT NOT NULL, user_id INTEGER NOT NULL REFERENCES users(user_id), description TEXT NOT NULL DEFAULT '', data TEXT NOT NULL, created_on_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS resource_snapshots_resource ON resource_snapshots(resource_id);",
      "CREATE TABLE IF NOT EXISTS resource_locks (resource_id INTEGER NOT NULL REFERENCES resources(resource_id), lock_type TEXT NOT NULL, created_on_ms INTEGER NOT NULL, PRIMARY KEY (resource_id, lock_type));",
      "CREATE TABLE IF NOT EXISTS resource_dependency_types (parent_resource_type TEXT NOT NULL, child_resource_type TEXT NOT NULL, PRIMARY KEY (parent_resource_type, child_resource_type));",
      "CREATE TABLE IF NOT EXISTS resource_dependencies (parent_resource_id INTEGER NOT NULL REFERENCES resources(resource_id), child_resource_id INTEGER NOT NULL REFERENCES resources(resource_id), parent_resource_type TEXT NOT NULL, child_resource_type TEXT NOT NULL, PRIMARY KEY (parent_resource_id, child_resource_id), FOREIGN KEY (parent_resource_type, child_resource_type) REFERENCES resource_dependency_types(parent_resource_type, child_resource_type));",
      "CREATE TABLE IF NOT EXISTS drafts (draft_id INTEGER PRIMARY KEY AUTOINCREMENT, group_id INTEGER NOT NULL REFERENCES user_groups(group_id), resource_type TEXT NOT NULL, user_id INTEGER NOT NULL REFERENCES users(user_id), payload TEXT NOT NULL, created_on_ms INTEGER NOT NULL, last_modified_on_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS drafts_one_modification_per_user ON drafts(user_id, json_extract(payload,'$.resource_id')) WHERE json_extract(payload,'$.resource_id') IS NOT NULL;",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS users (user_id BIGSERIAL PRIMARY KEY, username TEXT NOT NULL UNIQUE, created_on_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS user_locks (user_id BIGINT NOT NULL REFERENCES users(user_id), lock_type TEXT NOT NULL, created_on_ms BIGINT NOT NULL, PRIMARY KEY (user_id, lock_type));",
      "CREATE TABLE IF NOT EXISTS user_groups (group_id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE, creator_id BIGINT NOT NULL REFERENCES users(user_id), created_on_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS group_locks (group_id BIGINT NOT NULL REFERENCES user_groups(group_id), lock_type TEXT NOT NULL, created_on_ms BIGINT NOT NULL, PRIMARY KEY (group_id, lock_type));",
      "CREATE TABLE IF NOT EXISTS group_members (group_id BIGINT NOT NULL REFERENCES user_groups(group_id), user_id BIGINT NOT NULL REFERENCES users(user_id), PRIMARY KEY (group_id, user_id));",
      "CREATE TABLE IF NOT EXISTS resources (resource_id BIGSERIAL PRIMARY KEY, group_id BIGINT NOT NULL REFERENCES user_groups(group_id), resource_type TEXT NOT NULL, created_on_ms BIGINT NOT NULL, latest_snapshot_id BIGINT);",
      "CREATE TABLE IF NOT EXISTS resource_snapshots (resource_snapshot_id BIGSERIAL PRIMARY KEY, resource_id BIGINT NOT NULL REFERENCES resources(resource_id), resource_type TEXT NOT NULL, user_id BIGINT NOT NULL REFERENCES users(user_id), description TEXT NOT NULL DEFAULT '', data JSONB NOT NULL, created_on_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS resource_snapshots_resource ON resource_snapshots(resource_id);",
      "CREATE TABLE IF NOT EXISTS resource_locks (resource_id BIGINT NOT NULL REFERENCES resources(resource_id), lock_type TEXT NOT NULL, created_on_ms BIGINT NOT NULL, PRIMARY KEY (resource_id, lock_type));",
      "CREATE TABLE IF NOT EXISTS resource_dependency_types (parent_resource_type TEXT NOT NULL, child_resource_type TEXT NOT NULL, PRIMARY KEY (parent_resource_type, child_resource_type));",
      "CREATE TABLE IF NOT EXISTS resource_dependencies (parent_resource_id BIGINT NOT NULL REFERENCES resources(resource_id), child_resource_id BIGINT NOT NULL REFERENCES resources(resource_id), parent_resource_type TEXT NOT NULL, child_resource_type TEXT NOT NULL, PRIMARY KEY (parent_resource_id, child_resource_id), FOREIGN KEY (parent_resource_type, child_resource_type) REFERENCES resource_dependency_types(parent_resource_type, child_resource_type));",
      "CREATE TABLE IF NOT EXISTS drafts (draft_id BIGSERIAL PRIMARY KEY, group_id BIGINT NOT NULL REFERENCES user_groups(group_id), resource_type TEXT NOT NULL, user_id BIGINT NOT NULL REFERENCES users(user_id), payload JSONB NOT NULL, created_on_ms BIGINT NOT NULL, last_modified_on_ms BIGINT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS drafts_one_modification_per_user ON drafts (user_id, ((payload->>'resource_id')::bigint)) WHERE payload->>'resource_id' IS NOT NULL;",
  };
  return kSchema;
}

} // namespace draftstore::db::sql
