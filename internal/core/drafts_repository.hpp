#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "internal/core/checks.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/draft.hpp"

namespace draftstore::core {

struct DraftPage {
  std::vector<model::Draft> drafts;
  uint64_t                  total = 0; // matches across all pages
};

/*
  Drafts repository.

  Orchestrates creation, lookup, paged search, update and deletion of
  drafts while enforcing the cross-entity rules against users, groups,
  resources, snapshots and the dependency-rule table.

  Every validating operation runs its checks first and performs at most
  one write afterwards. Nothing is committed here: the caller owns the
  transaction and decides whether to commit or roll back.

  Failures are thrown as util::Error subclasses:

    NotFound / DraftDoesNotExist   missing user, group, resource, snapshot, draft
    EntityDeleted                  tombstoned user, group or resource
    UserNotInGroup                 creator is not in the target group
    DraftAlreadyExists             same draft id, or a second modification of
                                   one resource by one user
    DraftBaseInvalid               illegal (base type, draft type) pair
    DraftSnapshotIdInvalid         snapshot of another resource
    DraftTargetOwnerMismatch       draft owner differs from the resource owner
    DraftModificationRequired      snapshot change on a draft resource
    ReadOnlyLock                   modification of a read-only resource
*/
class DraftsRepository {
 public:
  explicit DraftsRepository(std::shared_ptr<db::Repository> repository);

  // Both assign draft.draft_id and the timestamps on success.
  void CreateDraftResource(db::Transaction& tx, model::Draft& draft);
  void CreateDraftModification(db::Transaction& tx, model::Draft& draft);

  // resource_type / creator_id make a non-matching draft look absent.
  std::optional<model::Draft> Get(db::Transaction& tx, int64_t draft_id,
                                  std::optional<model::ResourceType> resource_type = std::nullopt,
                                  std::optional<int64_t>             creator_id    = std::nullopt);

  model::Draft GetOne(db::Transaction& tx, int64_t draft_id,
                      std::optional<model::ResourceType> resource_type = std::nullopt,
                      std::optional<int64_t>             creator_id    = std::nullopt);

  std::optional<db::model::ResourceRecord> GetResource(db::Transaction& tx, int64_t resource_id,
                                                       DeletionPolicy policy = DeletionPolicy::NotDeleted);

  std::optional<model::Draft> GetDraftModificationByUser(db::Transaction& tx, int64_t user_id, int64_t resource_id);

  uint64_t GetNumDraftModifications(db::Transaction& tx, int64_t resource_id,
                                    std::optional<int64_t> except_user_id = std::nullopt);

  // Ordered by draft id. page_length <= 0 means no limit.
  DraftPage GetByFiltersPaged(db::Transaction& tx, db::DraftType draft_type, model::ResourceType resource_type,
                              int64_t user_id, std::optional<int64_t> group_id = std::nullopt,
                              std::optional<int64_t> base_resource_id = std::nullopt, int64_t page_start = 0,
                              int64_t page_length = -1);

  // Replaces resource_data and refreshes last_modified_on. A snapshot id
  // re-pins a draft modification within the same resource.
  model::Draft Update(db::Transaction& tx, const model::Draft& draft, const google::protobuf::Struct& resource_data,
                      std::optional<int64_t> resource_snapshot_id = std::nullopt);
  model::Draft Update(db::Transaction& tx, int64_t draft_id, const google::protobuf::Struct& resource_data,
                      std::optional<int64_t> resource_snapshot_id = std::nullopt);

  void Delete(db::Transaction& tx, const model::Draft& draft);
  void Delete(db::Transaction& tx, int64_t draft_id);

  std::set<int64_t> HasDraftModifications(db::Transaction& tx, const std::vector<int64_t>& resource_ids,
                                          std::optional<int64_t> user_id = std::nullopt);

  bool HasDraftModification(db::Transaction& tx, int64_t resource_id, std::optional<int64_t> user_id = std::nullopt);

 private:
  void ValidateCreator(db::Transaction& tx, const model::Draft& draft);
  void ValidateBaseResource(db::Transaction& tx, const model::Draft& draft, int64_t base_resource_id);
  void ValidateModificationTarget(db::Transaction& tx, const model::Draft& draft,
                                  const model::ModificationPayload& payload);
  void ValidateSnapshotOfResource(db::Transaction& tx, int64_t resource_id, int64_t snapshot_id);

  void Insert(db::Transaction& tx, model::Draft& draft);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace draftstore::core
