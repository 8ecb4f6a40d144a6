#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>
#include <vector>

#include "internal/core/resource_repository.hpp"
#include "internal/db/model/directory_record.hpp"
#include "service_context.hpp"

namespace draftstore::service {

/*
  Directory and committed-resource operations, one transaction each.
*/
class ResourceService {
public:
  explicit ResourceService(ServiceContext ctx);

  db::model::UserRecord  CreateUser(const std::string& username);
  db::model::GroupRecord CreateGroup(const std::string& name, int64_t creator_id);
  void                   JoinGroup(int64_t group_id, int64_t user_id);
  void                   LeaveGroup(int64_t group_id, int64_t user_id);

  core::ResourceRepository::Created CreateResource(model::ResourceType type, int64_t group_id, int64_t user_id,
                                                   const google::protobuf::Struct& data,
                                                   const std::string& description = "");

  db::model::SnapshotRecord AddSnapshot(int64_t resource_id, int64_t user_id, const google::protobuf::Struct& data,
                                        const std::string& description = "");

  void DeleteResource(int64_t resource_id);
  void LockResource(int64_t resource_id, const std::vector<model::ResourceLockType>& lock_types);

  db::model::ResourceRecord              GetResource(int64_t resource_id);
  std::vector<db::model::SnapshotRecord> GetHistory(int64_t resource_id);

  void AppendChild(int64_t parent_resource_id, int64_t child_resource_id);

private:
  ServiceContext ctx_;
};

}
