#include "drafts_repository.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/codec/draft_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace draftstore::core {

namespace {

std::string DraftLabel(int64_t draft_id) {
  return "draft " + std::to_string(draft_id);
}

std::string ResourceLabel(int64_t resource_id) {
  return "resource " + std::to_string(resource_id);
}

} // namespace

DraftsRepository::DraftsRepository(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

// ---------------------------------------------------------------------
// Validation steps
// ---------------------------------------------------------------------

void DraftsRepository::ValidateCreator(db::Transaction& tx, const model::Draft& draft) {
  AssertDraftDoesNotExist(*repository_, tx, draft.draft_id);
  AssertGroupExists(*repository_, tx, draft.target_owner_group_id, DeletionPolicy::NotDeleted);
  AssertUserExists(*repository_, tx, draft.creator_id, DeletionPolicy::NotDeleted);
  AssertUserInGroup(*repository_, tx, draft.creator_id, draft.target_owner_group_id);
}

// Existence, deletion and type legality of the base come from one lookup.
void DraftsRepository::ValidateBaseResource(db::Transaction& tx, const model::Draft& draft, int64_t base_resource_id) {
  auto base = repository_->CheckParentType(tx, base_resource_id, draft.resource_type);
  if (!base) {
    throw util::NotFound("base " + ResourceLabel(base_resource_id) + " does not exist");
  }
  if (base->is_deleted) {
    throw util::EntityDeleted("base " + ResourceLabel(base_resource_id) + " (" +
                              model::ResourceTypeTag(base->parent_type) + ") is deleted");
  }
  if (!base->legal) {
    throw util::DraftBaseInvalid("base " + ResourceLabel(base_resource_id) + " of type " +
                                 model::ResourceTypeTag(base->parent_type) + " cannot parent a " +
                                 model::ResourceTypeTag(draft.resource_type));
  }
}

void DraftsRepository::ValidateSnapshotOfResource(db::Transaction& tx, int64_t resource_id, int64_t snapshot_id) {
  auto snapshot = repository_->GetSnapshot(tx, snapshot_id);
  if (!snapshot || snapshot->resource_id != resource_id) {
    throw util::DraftSnapshotIdInvalid("snapshot " + std::to_string(snapshot_id) + " is not a snapshot of " +
                                       ResourceLabel(resource_id));
  }
}

void DraftsRepository::ValidateModificationTarget(db::Transaction& tx, const model::Draft& draft,
                                                  const model::ModificationPayload& payload) {
  auto resource = repository_->GetResource(tx, payload.resource_id);
  if (!resource) throw util::NotFound(ResourceLabel(payload.resource_id) + " does not exist");
  if (resource->is_deleted) throw util::EntityDeleted(ResourceLabel(payload.resource_id) + " is deleted");

  AssertSnapshotExists(*repository_, tx, payload.resource_snapshot_id);
  ValidateSnapshotOfResource(tx, payload.resource_id, payload.resource_snapshot_id);

  if (draft.target_owner_group_id != resource->group_id) {
    throw util::DraftTargetOwnerMismatch("draft owner group " + std::to_string(draft.target_owner_group_id) +
                                         " differs from owner group " + std::to_string(resource->group_id) + " of " +
                                         ResourceLabel(payload.resource_id));
  }
  if (draft.resource_type != resource->resource_type) {
    throw util::InvalidRelationship("draft type " + model::ResourceTypeTag(draft.resource_type) + " differs from " +
                                    ResourceLabel(payload.resource_id) + " type " +
                                    model::ResourceTypeTag(resource->resource_type));
  }
  if (resource->is_readonly) {
    throw util::ReadOnlyLock(ResourceLabel(payload.resource_id) + " is read-only");
  }

  // First wins: one modification per (resource, user).
  if (HasDraftModification(tx, payload.resource_id, draft.creator_id)) {
    throw util::DraftAlreadyExists("user " + std::to_string(draft.creator_id) +
                                   " already has a draft modification of " + ResourceLabel(payload.resource_id));
  }
}

void DraftsRepository::Insert(db::Transaction& tx, model::Draft& draft) {
  draft.created_on       = util::Now();
  draft.last_modified_on = draft.created_on;

  auto record = db::codec::ToDraftRecord(draft);
  auto result = repository_->InsertDraft(tx, record);
  if (result.code == db::ErrorCode::AlreadyExists || result.code == db::ErrorCode::ConstraintViolation) {
    throw util::DraftAlreadyExists("create draft: " + result.message);
  }
  ThrowIfDbError(result, "create draft");

  draft.draft_id = record.draft_id;
}

// ---------------------------------------------------------------------
// Create
// ---------------------------------------------------------------------

void DraftsRepository::CreateDraftResource(db::Transaction& tx, model::Draft& draft) {
  const auto* payload = std::get_if<model::NewResourcePayload>(&draft.payload);
  if (!payload) throw util::MalformedDraft("create draft resource: payload targets an existing resource");

  ValidateCreator(tx, draft);
  if (payload->base_resource_id) {
    ValidateBaseResource(tx, draft, *payload->base_resource_id);
  }

  Insert(tx, draft);
}

void DraftsRepository::CreateDraftModification(db::Transaction& tx, model::Draft& draft) {
  const auto* payload = std::get_if<model::ModificationPayload>(&draft.payload);
  if (!payload) throw util::MalformedDraft("create draft modification: payload has no target resource");

  ValidateCreator(tx, draft);
  ValidateModificationTarget(tx, draft, *payload);

  Insert(tx, draft);
}

// ---------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------

std::optional<model::Draft> DraftsRepository::Get(db::Transaction& tx, int64_t draft_id,
                                                  std::optional<model::ResourceType> resource_type,
                                                  std::optional<int64_t>             creator_id) {
  if (creator_id) {
    AssertUserExists(*repository_, tx, *creator_id, DeletionPolicy::NotDeleted);
  }

  auto record = repository_->GetDraft(tx, draft_id);
  if (!record) return std::nullopt;
  if (resource_type && record->resource_type != *resource_type) return std::nullopt;
  if (creator_id && record->user_id != *creator_id) return std::nullopt;

  return db::codec::FromDraftRecord(*record);
}

model::Draft DraftsRepository::GetOne(db::Transaction& tx, int64_t draft_id,
                                      std::optional<model::ResourceType> resource_type,
                                      std::optional<int64_t>             creator_id) {
  auto draft = Get(tx, draft_id, resource_type, creator_id);
  if (!draft) throw util::DraftDoesNotExist(DraftLabel(draft_id) + " does not exist");
  return *draft;
}

std::optional<db::model::ResourceRecord> DraftsRepository::GetResource(db::Transaction& tx, int64_t resource_id,
                                                                       DeletionPolicy policy) {
  auto resource = repository_->GetResource(tx, resource_id);
  if (!resource) return std::nullopt;
  if (policy == DeletionPolicy::NotDeleted && resource->is_deleted) return std::nullopt;
  if (policy == DeletionPolicy::Deleted && !resource->is_deleted) return std::nullopt;
  return resource;
}

std::optional<model::Draft> DraftsRepository::GetDraftModificationByUser(db::Transaction& tx, int64_t user_id,
                                                                         int64_t resource_id) {
  AssertUserExists(*repository_, tx, user_id, DeletionPolicy::NotDeleted);
  AssertResourceExists(*repository_, tx, resource_id, DeletionPolicy::NotDeleted);

  db::DraftFilter filter;
  filter.draft_type  = db::DraftType::kModification;
  filter.user_id     = user_id;
  filter.resource_id = resource_id;

  auto rows = repository_->FindDrafts(tx, filter, db::Pagination{0, 1});
  if (rows.empty()) return std::nullopt;
  return db::codec::FromDraftRecord(rows.front());
}

uint64_t DraftsRepository::GetNumDraftModifications(db::Transaction& tx, int64_t resource_id,
                                                    std::optional<int64_t> except_user_id) {
  if (except_user_id) {
    AssertUserExists(*repository_, tx, *except_user_id, DeletionPolicy::NotDeleted);
  }
  AssertResourceExists(*repository_, tx, resource_id, DeletionPolicy::NotDeleted);

  db::DraftFilter filter;
  filter.draft_type      = db::DraftType::kModification;
  filter.resource_id     = resource_id;
  filter.exclude_user_id = except_user_id;
  return repository_->CountDrafts(tx, filter);
}

DraftPage DraftsRepository::GetByFiltersPaged(db::Transaction& tx, db::DraftType draft_type,
                                              model::ResourceType resource_type, int64_t user_id,
                                              std::optional<int64_t> group_id,
                                              std::optional<int64_t> base_resource_id, int64_t page_start,
                                              int64_t page_length) {
  if (page_start < 0) throw std::invalid_argument("page_start must not be negative");

  AssertUserExists(*repository_, tx, user_id, DeletionPolicy::NotDeleted);
  if (group_id) {
    AssertGroupExists(*repository_, tx, *group_id, DeletionPolicy::NotDeleted);
  }
  if (base_resource_id) {
    AssertResourceExists(*repository_, tx, *base_resource_id, DeletionPolicy::NotDeleted);
  }

  db::DraftFilter filter;
  filter.draft_type       = draft_type;
  filter.resource_type    = resource_type;
  filter.user_id          = user_id;
  filter.group_id         = group_id;
  filter.base_resource_id = base_resource_id;

  DraftPage page;
  page.total = repository_->CountDrafts(tx, filter);
  if (page.total == 0) return page;

  db::Pagination pagination;
  pagination.offset = static_cast<std::size_t>(page_start);
  pagination.limit  = page_length > 0 ? static_cast<std::size_t>(page_length) : 0;

  for (const auto& row : repository_->FindDrafts(tx, filter, pagination)) {
    page.drafts.push_back(db::codec::FromDraftRecord(row));
  }
  return page;
}

// ---------------------------------------------------------------------
// Update / delete
// ---------------------------------------------------------------------

model::Draft DraftsRepository::Update(db::Transaction& tx, const model::Draft& draft,
                                      const google::protobuf::Struct& resource_data,
                                      std::optional<int64_t>          resource_snapshot_id) {
  return Update(tx, draft.draft_id, resource_data, resource_snapshot_id);
}

model::Draft DraftsRepository::Update(db::Transaction& tx, int64_t draft_id,
                                      const google::protobuf::Struct& resource_data,
                                      std::optional<int64_t>          resource_snapshot_id) {
  auto draft = GetOne(tx, draft_id);

  if (resource_snapshot_id) {
    auto* payload = std::get_if<model::ModificationPayload>(&draft.payload);
    if (!payload) {
      throw util::DraftModificationRequired(DraftLabel(draft_id) + " is a draft resource; it has no snapshot to change");
    }
    AssertSnapshotExists(*repository_, tx, *resource_snapshot_id);
    ValidateSnapshotOfResource(tx, payload->resource_id, *resource_snapshot_id);
    payload->resource_snapshot_id = *resource_snapshot_id;
  }

  model::MutableResourceData(draft) = resource_data;
  draft.last_modified_on            = util::Now();

  ThrowIfDbError(repository_->UpdateDraft(tx, db::codec::ToDraftRecord(draft)), "update " + DraftLabel(draft_id));
  return draft;
}

void DraftsRepository::Delete(db::Transaction& tx, const model::Draft& draft) {
  Delete(tx, draft.draft_id);
}

void DraftsRepository::Delete(db::Transaction& tx, int64_t draft_id) {
  AssertDraftExists(*repository_, tx, draft_id);
  ThrowIfDbError(repository_->DeleteDraft(tx, draft_id), "delete " + DraftLabel(draft_id));
}

// ---------------------------------------------------------------------
// Modification membership
// ---------------------------------------------------------------------

std::set<int64_t> DraftsRepository::HasDraftModifications(db::Transaction& tx, const std::vector<int64_t>& resource_ids,
                                                          std::optional<int64_t> user_id) {
  if (resource_ids.empty()) return {};
  auto found = repository_->ResourcesWithDraftModifications(tx, resource_ids, user_id);
  return std::set<int64_t>(found.begin(), found.end());
}

bool DraftsRepository::HasDraftModification(db::Transaction& tx, int64_t resource_id, std::optional<int64_t> user_id) {
  db::DraftFilter filter;
  filter.draft_type  = db::DraftType::kModification;
  filter.resource_id = resource_id;
  filter.user_id     = user_id;
  return !repository_->FindDrafts(tx, filter, db::Pagination{0, 1}).empty();
}

} // namespace draftstore::core
