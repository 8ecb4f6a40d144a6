#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace draftstore::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertUser(Transaction&, model::UserRecord&) override;
  std::optional<model::UserRecord> GetUser(Transaction&, int64_t) override;
  Result LockUser(Transaction&, int64_t) override;
  Result InsertGroup(Transaction&, model::GroupRecord&) override;
  std::optional<model::GroupRecord> GetGroup(Transaction&, int64_t) override;
  Result LockGroup(Transaction&, int64_t) override;
  Result AddGroupMember(Transaction&, int64_t group_id, int64_t user_id) override;
  Result RemoveGroupMember(Transaction&, int64_t group_id, int64_t user_id) override;
  bool IsGroupMember(Transaction&, int64_t group_id, int64_t user_id) override;

  Result InsertResource(Transaction&, model::ResourceRecord&) override;
  std::optional<model::ResourceRecord> GetResource(Transaction&, int64_t) override;
  Result InsertSnapshot(Transaction&, model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, int64_t) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, int64_t) override;
  Result InsertLock(Transaction&, const model::LockRecord&) override;
  std::vector<model::LockRecord> GetLocks(Transaction&, int64_t) override;

  Result InsertDependencyType(Transaction&, const model::DependencyTypeRecord&) override;
  std::vector<model::DependencyTypeRecord> ListDependencyTypes(Transaction&) override;
  std::optional<ParentTypeCheck> CheckParentType(Transaction&, int64_t,
                                                 draftstore::v1::ResourceType) override;
  Result InsertDependency(Transaction&, const model::DependencyRecord&) override;
  Result DeleteDependency(Transaction&, int64_t, int64_t) override;
  std::vector<model::DependencyRecord> GetChildren(Transaction&, int64_t) override;
  std::vector<model::DependencyRecord> GetParents(Transaction&, int64_t) override;

  Result InsertDraft(Transaction&, model::DraftRecord&) override;
  std::optional<model::DraftRecord> GetDraft(Transaction&, int64_t) override;
  Result UpdateDraft(Transaction&, const model::DraftRecord&) override;
  Result DeleteDraft(Transaction&, int64_t) override;
  std::vector<model::DraftRecord> FindDrafts(Transaction&, const DraftFilter&, const Pagination&) override;
  uint64_t CountDrafts(Transaction&, const DraftFilter&) override;
  std::vector<int64_t> ResourcesWithDraftModifications(Transaction&, const std::vector<int64_t>&,
                                                       std::optional<int64_t>) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::UserRecord>       users;
    std::map<int64_t, model::GroupRecord>      groups;
    std::set<std::pair<int64_t, int64_t>>      members; // (group_id, user_id)
    std::map<int64_t, model::ResourceRecord>   resources;
    std::map<int64_t, model::SnapshotRecord>   snapshots;
    std::vector<model::LockRecord>             locks;
    std::vector<model::DependencyTypeRecord>   dependency_types;
    std::vector<model::DependencyRecord>       dependencies;
    std::map<int64_t, model::DraftRecord>      drafts; // ordered by draft_id

    int64_t next_user_id     = 1;
    int64_t next_group_id    = 1;
    int64_t next_resource_id = 1;
    int64_t next_snapshot_id = 1;
    int64_t next_draft_id    = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace draftstore::db::memory
