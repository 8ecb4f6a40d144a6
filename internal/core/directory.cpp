#include "directory.hpp"

#include <stdexcept>

#include "internal/core/checks.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace draftstore::core {

Directory::Directory(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::UserRecord Directory::CreateUser(db::Transaction& tx, const std::string& username) {
  if (username.empty()) throw std::invalid_argument("create user: username must not be empty");

  db::model::UserRecord record;
  record.username      = username;
  record.created_on_ms = util::ToUnixMillis(util::Now());

  auto result = repository_->InsertUser(tx, record);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    throw util::AlreadyExists("create user: username '" + username + "' is taken");
  }
  ThrowIfDbError(result, "create user");
  return record;
}

db::model::GroupRecord Directory::CreateGroup(db::Transaction& tx, const std::string& name, int64_t creator_id) {
  if (name.empty()) throw std::invalid_argument("create group: name must not be empty");
  AssertUserExists(*repository_, tx, creator_id, DeletionPolicy::NotDeleted);

  db::model::GroupRecord record;
  record.name          = name;
  record.creator_id    = creator_id;
  record.created_on_ms = util::ToUnixMillis(util::Now());

  auto result = repository_->InsertGroup(tx, record);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    throw util::AlreadyExists("create group: name '" + name + "' is taken");
  }
  ThrowIfDbError(result, "create group");
  ThrowIfDbError(repository_->AddGroupMember(tx, record.group_id, creator_id), "create group: add creator");
  return record;
}

void Directory::AddMember(db::Transaction& tx, int64_t group_id, int64_t user_id) {
  AssertGroupExists(*repository_, tx, group_id, DeletionPolicy::NotDeleted);
  AssertUserExists(*repository_, tx, user_id, DeletionPolicy::NotDeleted);
  if (repository_->IsGroupMember(tx, group_id, user_id)) return;
  ThrowIfDbError(repository_->AddGroupMember(tx, group_id, user_id), "add member");
}

void Directory::RemoveMember(db::Transaction& tx, int64_t group_id, int64_t user_id) {
  AssertGroupExists(*repository_, tx, group_id, DeletionPolicy::Any);
  AssertUserInGroup(*repository_, tx, user_id, group_id);
  ThrowIfDbError(repository_->RemoveGroupMember(tx, group_id, user_id), "remove member");
}

void Directory::DeleteUser(db::Transaction& tx, int64_t user_id) {
  AssertUserExists(*repository_, tx, user_id, DeletionPolicy::Any);
  ThrowIfDbError(repository_->LockUser(tx, user_id), "delete user");
}

void Directory::DeleteGroup(db::Transaction& tx, int64_t group_id) {
  AssertGroupExists(*repository_, tx, group_id, DeletionPolicy::Any);
  ThrowIfDbError(repository_->LockGroup(tx, group_id), "delete group");
}

} // namespace draftstore::core
