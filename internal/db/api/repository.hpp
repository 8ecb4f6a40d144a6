#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/dependency_record.hpp"
#include "internal/db/model/directory_record.hpp"
#include "internal/db/model/draft_record.hpp"
#include "internal/db/model/resource_record.hpp"

namespace draftstore::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All operations run inside a caller-owned Transaction
  - Reads inside a transaction see its writes
  - Id assignment on insert is atomic
  - Snapshots and locks are append-only
  - At most one draft row per (user_id, payload.resource_id) with a
    non-null resource_id; a second insert fails with ConstraintViolation

  Cross-entity rules (ownership, membership, type legality) are NOT
  enforced here; that is the job of internal/core.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Users / groups
  // ---------------------------------------------------------------------

  virtual Result InsertUser(Transaction&, model::UserRecord&) = 0;

  virtual std::optional<model::UserRecord> GetUser(Transaction&, int64_t user_id) = 0;

  virtual Result LockUser(Transaction&, int64_t user_id) = 0;

  virtual Result InsertGroup(Transaction&, model::GroupRecord&) = 0;

  virtual std::optional<model::GroupRecord> GetGroup(Transaction&, int64_t group_id) = 0;

  virtual Result LockGroup(Transaction&, int64_t group_id) = 0;

  virtual Result AddGroupMember(Transaction&, int64_t group_id, int64_t user_id) = 0;

  virtual Result RemoveGroupMember(Transaction&, int64_t group_id, int64_t user_id) = 0;

  virtual bool IsGroupMember(Transaction&, int64_t group_id, int64_t user_id) = 0;

  // ---------------------------------------------------------------------
  // Resources
  // ---------------------------------------------------------------------

  virtual Result InsertResource(Transaction&, model::ResourceRecord&) = 0;

  virtual std::optional<model::ResourceRecord> GetResource(Transaction&, int64_t resource_id) = 0;

  // Assigns snapshot_id and repoints the resource's latest_snapshot_id.
  virtual Result InsertSnapshot(Transaction&, model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, int64_t snapshot_id) = 0;

  // Ordered by snapshot_id ascending.
  virtual std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, int64_t resource_id) = 0;

  // AlreadyExists if the resource already carries this lock type.
  virtual Result InsertLock(Transaction&, const model::LockRecord&) = 0;

  virtual std::vector<model::LockRecord> GetLocks(Transaction&, int64_t resource_id) = 0;

  // ---------------------------------------------------------------------
  // Dependency rules / edges
  // ---------------------------------------------------------------------

  // Idempotent.
  virtual Result InsertDependencyType(Transaction&, const model::DependencyTypeRecord&) = 0;

  virtual std::vector<model::DependencyTypeRecord> ListDependencyTypes(Transaction&) = 0;

  // Deletion state, type and pair legality of parent_resource_id in a
  // single lookup. nullopt if the resource does not exist.
  virtual std::optional<ParentTypeCheck> CheckParentType(Transaction&, int64_t parent_resource_id,
                                                         draftstore::v1::ResourceType child_type) = 0;

  virtual Result InsertDependency(Transaction&, const model::DependencyRecord&) = 0;

  virtual Result DeleteDependency(Transaction&, int64_t parent_resource_id, int64_t child_resource_id) = 0;

  virtual std::vector<model::DependencyRecord> GetChildren(Transaction&, int64_t parent_resource_id) = 0;

  virtual std::vector<model::DependencyRecord> GetParents(Transaction&, int64_t child_resource_id) = 0;

  // ---------------------------------------------------------------------
  // Drafts
  // ---------------------------------------------------------------------

  virtual Result InsertDraft(Transaction&, model::DraftRecord&) = 0;

  virtual std::optional<model::DraftRecord> GetDraft(Transaction&, int64_t draft_id) = 0;

  virtual Result UpdateDraft(Transaction&, const model::DraftRecord&) = 0;

  virtual Result DeleteDraft(Transaction&, int64_t draft_id) = 0;

  virtual std::vector<model::DraftRecord> FindDrafts(Transaction&, const DraftFilter&, const Pagination&) = 0;

  virtual uint64_t CountDrafts(Transaction&, const DraftFilter&) = 0;

  // Subset of resource_ids with at least one draft modification,
  // optionally only those created by user_id.
  virtual std::vector<int64_t> ResourcesWithDraftModifications(Transaction&, const std::vector<int64_t>& resource_ids,
                                                               std::optional<int64_t> user_id) = 0;
};

} // namespace draftstore::db
