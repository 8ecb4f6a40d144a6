#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/checks.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/resource_type.hpp"

namespace draftstore::core {

/*
  Resources, their snapshot history, locks and parent/child edges.

  Snapshots are append-only: every edit inserts a new row and repoints
  latest_snapshot_id. A DELETE lock is permanent; a READONLY lock stops
  further snapshots and locks. All calls run in the caller's transaction.
*/
class ResourceRepository {
 public:
  struct Created {
    db::model::ResourceRecord resource;
    db::model::SnapshotRecord snapshot;
  };

  explicit ResourceRepository(std::shared_ptr<db::Repository> repository);

  Created Create(db::Transaction& tx, model::ResourceType type, int64_t owner_group_id, int64_t creator_id,
                 const google::protobuf::Struct& data, const std::string& description);

  db::model::SnapshotRecord AddSnapshot(db::Transaction& tx, int64_t resource_id, int64_t creator_id,
                                        const google::protobuf::Struct& data, const std::string& description);

  // No-op on an already deleted resource.
  void Delete(db::Transaction& tx, int64_t resource_id);

  // Lock types already present are skipped.
  void AddLocks(db::Transaction& tx, int64_t resource_id, const std::vector<model::ResourceLockType>& lock_types);

  std::optional<db::model::ResourceRecord> GetResource(db::Transaction& tx, int64_t resource_id,
                                                       DeletionPolicy policy = DeletionPolicy::NotDeleted);

  std::optional<db::model::SnapshotRecord> GetSnapshot(db::Transaction& tx, int64_t snapshot_id);
  std::optional<db::model::SnapshotRecord> GetLatestSnapshot(db::Transaction& tx, int64_t resource_id);

  // Oldest first.
  std::vector<db::model::SnapshotRecord> GetHistory(db::Transaction& tx, int64_t resource_id);

  std::vector<model::ResourceLockType> GetLockTypes(db::Transaction& tx, int64_t resource_id);

  // No-op when the edge already exists.
  void AppendChild(db::Transaction& tx, int64_t parent_resource_id, int64_t child_resource_id);
  // Both resources must exist; no-op when they are not linked.
  void UnlinkChild(db::Transaction& tx, int64_t parent_resource_id, int64_t child_resource_id);

  std::vector<db::model::DependencyRecord> GetChildren(db::Transaction& tx, int64_t parent_resource_id);
  std::vector<db::model::DependencyRecord> GetParents(db::Transaction& tx, int64_t child_resource_id);

 private:
  db::model::ResourceRecord RequireLiveResource(db::Transaction& tx, int64_t resource_id);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace draftstore::core
