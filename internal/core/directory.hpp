#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace draftstore::core {

/*
  Minimal store-backed user / group directory.

  Deletion is an append-only lock; deleted users and groups stay
  resolvable so that history rows keep pointing somewhere.
*/
class Directory {
 public:
  explicit Directory(std::shared_ptr<db::Repository> repository);

  db::model::UserRecord CreateUser(db::Transaction& tx, const std::string& username);

  // The creator becomes the first member.
  db::model::GroupRecord CreateGroup(db::Transaction& tx, const std::string& name, int64_t creator_id);

  void AddMember(db::Transaction& tx, int64_t group_id, int64_t user_id);
  void RemoveMember(db::Transaction& tx, int64_t group_id, int64_t user_id);

  void DeleteUser(db::Transaction& tx, int64_t user_id);
  void DeleteGroup(db::Transaction& tx, int64_t group_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace draftstore::core
