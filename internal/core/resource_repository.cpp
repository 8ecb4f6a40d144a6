#include "resource_repository.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/codec/draft_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace draftstore::core {

namespace {

std::string ResourceLabel(int64_t resource_id) {
  return "resource " + std::to_string(resource_id);
}

} // namespace

ResourceRepository::ResourceRepository(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

db::model::ResourceRecord ResourceRepository::RequireLiveResource(db::Transaction& tx, int64_t resource_id) {
  auto resource = repository_->GetResource(tx, resource_id);
  if (!resource) throw util::NotFound(ResourceLabel(resource_id) + " does not exist");
  if (resource->is_deleted) throw util::EntityDeleted(ResourceLabel(resource_id) + " is deleted");
  return *resource;
}

ResourceRepository::Created ResourceRepository::Create(db::Transaction& tx, model::ResourceType type,
                                                       int64_t owner_group_id, int64_t creator_id,
                                                       const google::protobuf::Struct& data,
                                                       const std::string& description) {
  if (type == draftstore::v1::RESOURCE_TYPE_UNSPECIFIED) {
    throw std::invalid_argument("create resource: resource type is required");
  }
  AssertGroupExists(*repository_, tx, owner_group_id, DeletionPolicy::NotDeleted);
  AssertUserExists(*repository_, tx, creator_id, DeletionPolicy::NotDeleted);
  AssertUserInGroup(*repository_, tx, creator_id, owner_group_id);

  const auto now_ms = util::ToUnixMillis(util::Now());

  Created created;
  created.resource.group_id      = owner_group_id;
  created.resource.resource_type = type;
  created.resource.created_on_ms = now_ms;
  ThrowIfDbError(repository_->InsertResource(tx, created.resource), "create resource");

  created.snapshot.resource_id   = created.resource.resource_id;
  created.snapshot.resource_type = type;
  created.snapshot.user_id       = creator_id;
  created.snapshot.description   = description;
  created.snapshot.data          = db::codec::EncodeResourceData(data);
  created.snapshot.created_on_ms = now_ms;
  ThrowIfDbError(repository_->InsertSnapshot(tx, created.snapshot), "create resource: first snapshot");

  created.resource.latest_snapshot_id = created.snapshot.snapshot_id;
  return created;
}

db::model::SnapshotRecord ResourceRepository::AddSnapshot(db::Transaction& tx, int64_t resource_id,
                                                          int64_t creator_id, const google::protobuf::Struct& data,
                                                          const std::string& description) {
  auto resource = RequireLiveResource(tx, resource_id);
  if (resource.is_readonly) throw util::ReadOnlyLock(ResourceLabel(resource_id) + " is read-only");

  AssertUserExists(*repository_, tx, creator_id, DeletionPolicy::NotDeleted);
  AssertUserInGroup(*repository_, tx, creator_id, resource.group_id);

  db::model::SnapshotRecord snapshot;
  snapshot.resource_id   = resource_id;
  snapshot.resource_type = resource.resource_type;
  snapshot.user_id       = creator_id;
  snapshot.description   = description;
  snapshot.data          = db::codec::EncodeResourceData(data);
  snapshot.created_on_ms = util::ToUnixMillis(util::Now());
  ThrowIfDbError(repository_->InsertSnapshot(tx, snapshot), "add snapshot");
  return snapshot;
}

void ResourceRepository::Delete(db::Transaction& tx, int64_t resource_id) {
  auto resource = repository_->GetResource(tx, resource_id);
  if (!resource) throw util::NotFound(ResourceLabel(resource_id) + " does not exist");
  if (resource->is_deleted) return;
  if (resource->is_readonly) throw util::ReadOnlyLock(ResourceLabel(resource_id) + " is read-only");

  db::model::LockRecord lock;
  lock.resource_id   = resource_id;
  lock.lock_type     = draftstore::v1::RESOURCE_LOCK_TYPE_DELETE;
  lock.created_on_ms = util::ToUnixMillis(util::Now());
  ThrowIfDbError(repository_->InsertLock(tx, lock), "delete resource");
}

void ResourceRepository::AddLocks(db::Transaction& tx, int64_t resource_id,
                                  const std::vector<model::ResourceLockType>& lock_types) {
  auto resource = repository_->GetResource(tx, resource_id);
  if (!resource) throw util::NotFound(ResourceLabel(resource_id) + " does not exist");

  auto existing = GetLockTypes(tx, resource_id);
  const auto now_ms = util::ToUnixMillis(util::Now());

  for (auto lock_type : lock_types) {
    if (lock_type == draftstore::v1::RESOURCE_LOCK_TYPE_UNSPECIFIED) {
      throw std::invalid_argument("add locks: lock type is required");
    }
    if (std::find(existing.begin(), existing.end(), lock_type) != existing.end()) continue;

    if (resource->is_deleted) throw util::EntityDeleted(ResourceLabel(resource_id) + " is deleted");
    if (resource->is_readonly) throw util::ReadOnlyLock(ResourceLabel(resource_id) + " is read-only");

    db::model::LockRecord lock;
    lock.resource_id   = resource_id;
    lock.lock_type     = lock_type;
    lock.created_on_ms = now_ms;
    ThrowIfDbError(repository_->InsertLock(tx, lock), "add lock " + model::LockTypeTag(lock_type));
    existing.push_back(lock_type);

    resource->is_deleted  = resource->is_deleted || lock_type == draftstore::v1::RESOURCE_LOCK_TYPE_DELETE;
    resource->is_readonly = resource->is_readonly || lock_type == draftstore::v1::RESOURCE_LOCK_TYPE_READONLY;
  }
}

std::optional<db::model::ResourceRecord> ResourceRepository::GetResource(db::Transaction& tx, int64_t resource_id,
                                                                         DeletionPolicy policy) {
  auto resource = repository_->GetResource(tx, resource_id);
  if (!resource) return std::nullopt;
  if (policy == DeletionPolicy::NotDeleted && resource->is_deleted) return std::nullopt;
  if (policy == DeletionPolicy::Deleted && !resource->is_deleted) return std::nullopt;
  return resource;
}

std::optional<db::model::SnapshotRecord> ResourceRepository::GetSnapshot(db::Transaction& tx, int64_t snapshot_id) {
  return repository_->GetSnapshot(tx, snapshot_id);
}

std::optional<db::model::SnapshotRecord> ResourceRepository::GetLatestSnapshot(db::Transaction& tx,
                                                                               int64_t resource_id) {
  auto resource = repository_->GetResource(tx, resource_id);
  if (!resource || !resource->latest_snapshot_id) return std::nullopt;
  return repository_->GetSnapshot(tx, *resource->latest_snapshot_id);
}

std::vector<db::model::SnapshotRecord> ResourceRepository::GetHistory(db::Transaction& tx, int64_t resource_id) {
  AssertResourceExists(*repository_, tx, resource_id, DeletionPolicy::Any);
  return repository_->ListSnapshots(tx, resource_id);
}

std::vector<model::ResourceLockType> ResourceRepository::GetLockTypes(db::Transaction& tx, int64_t resource_id) {
  std::vector<model::ResourceLockType> out;
  for (const auto& lock : repository_->GetLocks(tx, resource_id)) {
    out.push_back(lock.lock_type);
  }
  return out;
}

void ResourceRepository::AppendChild(db::Transaction& tx, int64_t parent_resource_id, int64_t child_resource_id) {
  if (parent_resource_id == child_resource_id) {
    throw util::InvalidRelationship(ResourceLabel(parent_resource_id) + " cannot be its own parent");
  }

  auto child = RequireLiveResource(tx, child_resource_id);

  auto parent = repository_->CheckParentType(tx, parent_resource_id, child.resource_type);
  if (!parent) throw util::NotFound(ResourceLabel(parent_resource_id) + " does not exist");
  if (parent->is_deleted) throw util::EntityDeleted(ResourceLabel(parent_resource_id) + " is deleted");
  if (!parent->legal) {
    throw util::InvalidRelationship("a " + model::ResourceTypeTag(parent->parent_type) + " cannot parent a " +
                                    model::ResourceTypeTag(child.resource_type));
  }

  // Already linked children are skipped.
  for (const auto& existing : repository_->GetParents(tx, child_resource_id)) {
    if (existing.parent_resource_id == parent_resource_id) return;
  }

  db::model::DependencyRecord edge;
  edge.parent_resource_id   = parent_resource_id;
  edge.child_resource_id    = child_resource_id;
  edge.parent_resource_type = parent->parent_type;
  edge.child_resource_type  = child.resource_type;
  ThrowIfDbError(repository_->InsertDependency(tx, edge), "append child");
}

void ResourceRepository::UnlinkChild(db::Transaction& tx, int64_t parent_resource_id, int64_t child_resource_id) {
  AssertResourceExists(*repository_, tx, parent_resource_id, DeletionPolicy::Any);
  AssertResourceExists(*repository_, tx, child_resource_id, DeletionPolicy::Any);

  auto result = repository_->DeleteDependency(tx, parent_resource_id, child_resource_id);
  if (result.code == db::ErrorCode::NotFound) return; // not linked
  ThrowIfDbError(result, "unlink child");
}

std::vector<db::model::DependencyRecord> ResourceRepository::GetChildren(db::Transaction& tx,
                                                                         int64_t parent_resource_id) {
  return repository_->GetChildren(tx, parent_resource_id);
}

std::vector<db::model::DependencyRecord> ResourceRepository::GetParents(db::Transaction& tx,
                                                                        int64_t child_resource_id) {
  return repository_->GetParents(tx, child_resource_id);
}

} // namespace draftstore::core
