#include "resource_service.hpp"

#include "internal/core/directory.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/transaction_scope.hpp"
#include "internal/util/errors.hpp"

namespace draftstore::service {

using draftstore::observability::IntField;
using draftstore::observability::StringField;

ResourceService::ResourceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

db::model::UserRecord ResourceService::CreateUser(const std::string& username) {
  return RunInTransaction(*ctx_.repository, "ResourceService.CreateUser", [&](db::Transaction& tx) {
    return ctx_.directory->CreateUser(tx, username);
  });
}

db::model::GroupRecord ResourceService::CreateGroup(const std::string& name, int64_t creator_id) {
  return RunInTransaction(*ctx_.repository, "ResourceService.CreateGroup", [&](db::Transaction& tx) {
    return ctx_.directory->CreateGroup(tx, name, creator_id);
  });
}

void ResourceService::JoinGroup(int64_t group_id, int64_t user_id) {
  RunInTransaction(*ctx_.repository, "ResourceService.JoinGroup", [&](db::Transaction& tx) {
    ctx_.directory->AddMember(tx, group_id, user_id);
  });
}

void ResourceService::LeaveGroup(int64_t group_id, int64_t user_id) {
  RunInTransaction(*ctx_.repository, "ResourceService.LeaveGroup", [&](db::Transaction& tx) {
    ctx_.directory->RemoveMember(tx, group_id, user_id);
  });
}

core::ResourceRepository::Created ResourceService::CreateResource(model::ResourceType type, int64_t group_id,
                                                                  int64_t user_id, const google::protobuf::Struct& data,
                                                                  const std::string& description) {
  return RunInTransaction(*ctx_.repository, "ResourceService.CreateResource", [&](db::Transaction& tx) {
    auto created = ctx_.resources->Create(tx, type, group_id, user_id, data, description);
    DRAFTSTORE_LOG_DEBUG("resource created", {IntField("resource_id", created.resource.resource_id),
                                              StringField("type", model::ResourceTypeTag(type)),
                                              IntField("group_id", group_id)});
    return created;
  });
}

db::model::SnapshotRecord ResourceService::AddSnapshot(int64_t resource_id, int64_t user_id,
                                                       const google::protobuf::Struct& data,
                                                       const std::string& description) {
  return RunInTransaction(*ctx_.repository, "ResourceService.AddSnapshot", [&](db::Transaction& tx) {
    return ctx_.resources->AddSnapshot(tx, resource_id, user_id, data, description);
  });
}

void ResourceService::DeleteResource(int64_t resource_id) {
  RunInTransaction(*ctx_.repository, "ResourceService.DeleteResource", [&](db::Transaction& tx) {
    ctx_.resources->Delete(tx, resource_id);
  });
}

void ResourceService::LockResource(int64_t resource_id, const std::vector<model::ResourceLockType>& lock_types) {
  RunInTransaction(*ctx_.repository, "ResourceService.LockResource", [&](db::Transaction& tx) {
    ctx_.resources->AddLocks(tx, resource_id, lock_types);
  });
}

db::model::ResourceRecord ResourceService::GetResource(int64_t resource_id) {
  return RunInTransaction(*ctx_.repository, "ResourceService.GetResource", [&](db::Transaction& tx) {
    auto resource = ctx_.resources->GetResource(tx, resource_id, core::DeletionPolicy::Any);
    if (!resource) throw util::NotFound("resource " + std::to_string(resource_id) + " does not exist");
    return *resource;
  });
}

std::vector<db::model::SnapshotRecord> ResourceService::GetHistory(int64_t resource_id) {
  return RunInTransaction(*ctx_.repository, "ResourceService.GetHistory", [&](db::Transaction& tx) {
    return ctx_.resources->GetHistory(tx, resource_id);
  });
}

void ResourceService::AppendChild(int64_t parent_resource_id, int64_t child_resource_id) {
  RunInTransaction(*ctx_.repository, "ResourceService.AppendChild", [&](db::Transaction& tx) {
    ctx_.resources->AppendChild(tx, parent_resource_id, child_resource_id);
  });
}

}
