#include "draft_service.hpp"

#include "internal/core/directory.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/transaction_scope.hpp"
#include "internal/util/errors.hpp"

namespace draftstore::service {

using draftstore::observability::IntField;
using draftstore::observability::StringField;

DraftService::DraftService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

model::Draft DraftService::CreateDraft(int64_t user_id, model::ResourceType resource_type,
                                       std::optional<int64_t> group_id, std::optional<int64_t> base_resource_id,
                                       const google::protobuf::Struct& data) {
  return RunInTransaction(*ctx_.repository, "DraftService.CreateDraft", [&](db::Transaction& tx) {
    model::Draft draft;
    draft.resource_type = resource_type;
    draft.creator_id    = user_id;

    if (base_resource_id) {
      auto base = ctx_.drafts->GetResource(tx, *base_resource_id, core::DeletionPolicy::Any);
      if (!base) throw util::NotFound("base resource " + std::to_string(*base_resource_id) + " does not exist");
      if (group_id && *group_id != base->group_id) {
        throw util::DraftTargetOwnerMismatch("group " + std::to_string(*group_id) + " does not own base resource " +
                                             std::to_string(*base_resource_id));
      }
      draft.target_owner_group_id = base->group_id;
    } else if (group_id) {
      draft.target_owner_group_id = *group_id;
    } else {
      throw util::MalformedDraft("create draft: a group or a base resource is required");
    }

    draft.payload = model::NewResourcePayload{data, base_resource_id};
    ctx_.drafts->CreateDraftResource(tx, draft);

    DRAFTSTORE_LOG_DEBUG("draft resource created", {IntField("draft_id", draft.draft_id), IntField("user_id", user_id),
                                                    StringField("type", model::ResourceTypeTag(resource_type))});
    return draft;
  });
}

ModificationCreated DraftService::CreateModification(int64_t user_id, model::ResourceType resource_type,
                                                     int64_t resource_id, const google::protobuf::Struct& data) {
  return RunInTransaction(*ctx_.repository, "DraftService.CreateModification", [&](db::Transaction& tx) {
    auto resource = ctx_.drafts->GetResource(tx, resource_id, core::DeletionPolicy::Any);
    if (!resource || resource->resource_type != resource_type) {
      throw util::NotFound(model::ResourceTypeTag(resource_type) + " " + std::to_string(resource_id) +
                           " does not exist");
    }
    if (!resource->latest_snapshot_id) {
      throw util::InvalidState("resource " + std::to_string(resource_id) + " has no snapshot");
    }

    ModificationCreated created;
    created.draft.resource_type         = resource_type;
    created.draft.target_owner_group_id = resource->group_id;
    created.draft.creator_id            = user_id;

    model::ModificationPayload payload;
    payload.resource_data        = data;
    payload.resource_id          = resource_id;
    payload.resource_snapshot_id = *resource->latest_snapshot_id;
    created.draft.payload        = std::move(payload);

    ctx_.drafts->CreateDraftModification(tx, created.draft);
    created.num_other_drafts = ctx_.drafts->GetNumDraftModifications(tx, resource_id, user_id);

    DRAFTSTORE_LOG_DEBUG("draft modification created",
                         {IntField("draft_id", created.draft.draft_id), IntField("user_id", user_id),
                          IntField("resource_id", resource_id),
                          IntField("other_drafts", static_cast<int64_t>(created.num_other_drafts))});
    return created;
  });
}

model::Draft DraftService::ModifyDraft(int64_t user_id, int64_t draft_id, const google::protobuf::Struct& data,
                                       std::optional<int64_t> resource_snapshot_id) {
  return RunInTransaction(*ctx_.repository, "DraftService.ModifyDraft", [&](db::Transaction& tx) {
    auto draft = ctx_.drafts->GetOne(tx, draft_id, std::nullopt, user_id);

    if (resource_snapshot_id) {
      if (const auto* mod = std::get_if<model::ModificationPayload>(&draft.payload)) {
        if (*resource_snapshot_id < mod->resource_snapshot_id) {
          throw util::InvalidDraftBaseSnapshot("snapshot " + std::to_string(*resource_snapshot_id) +
                                               " is older than the pinned snapshot " +
                                               std::to_string(mod->resource_snapshot_id));
        }
      }
    }

    return ctx_.drafts->Update(tx, draft, data, resource_snapshot_id);
  });
}

void DraftService::DeleteDraft(int64_t user_id, int64_t draft_id) {
  RunInTransaction(*ctx_.repository, "DraftService.DeleteDraft", [&](db::Transaction& tx) {
    auto draft = ctx_.drafts->GetOne(tx, draft_id, std::nullopt, user_id);
    ctx_.drafts->Delete(tx, draft);
    DRAFTSTORE_LOG_DEBUG("draft discarded", {IntField("draft_id", draft_id), IntField("user_id", user_id)});
  });
}

core::ResourceRepository::Created DraftService::CommitDraft(int64_t user_id, int64_t draft_id) {
  return RunInTransaction(*ctx_.repository, "DraftService.CommitDraft", [&](db::Transaction& tx) {
    auto draft = ctx_.drafts->GetOne(tx, draft_id, std::nullopt, user_id);

    core::ResourceRepository::Created committed;
    if (const auto* mod = std::get_if<model::ModificationPayload>(&draft.payload)) {
      auto latest = ctx_.resources->GetLatestSnapshot(tx, mod->resource_id);
      if (!latest || latest->snapshot_id != mod->resource_snapshot_id) {
        throw util::DraftCommitConflict("draft " + std::to_string(draft_id) + " is pinned to snapshot " +
                                        std::to_string(mod->resource_snapshot_id) +
                                        " but resource " + std::to_string(mod->resource_id) + " has moved on");
      }
      committed.snapshot = ctx_.resources->AddSnapshot(tx, mod->resource_id, user_id, mod->resource_data, "");
      committed.resource = *ctx_.resources->GetResource(tx, mod->resource_id, core::DeletionPolicy::Any);
    } else {
      const auto& created = std::get<model::NewResourcePayload>(draft.payload);
      committed = ctx_.resources->Create(tx, draft.resource_type, draft.target_owner_group_id, user_id,
                                         created.resource_data, "");
      if (created.base_resource_id) {
        ctx_.resources->AppendChild(tx, *created.base_resource_id, committed.resource.resource_id);
      }
    }

    ctx_.drafts->Delete(tx, draft);

    DRAFTSTORE_LOG_DEBUG("draft committed", {IntField("draft_id", draft_id), IntField("user_id", user_id),
                                             IntField("resource_id", committed.resource.resource_id),
                                             IntField("snapshot_id", committed.snapshot.snapshot_id)});
    return committed;
  });
}

model::Draft DraftService::GetDraft(int64_t user_id, int64_t draft_id, std::optional<model::ResourceType> resource_type) {
  return RunInTransaction(*ctx_.repository, "DraftService.GetDraft", [&](db::Transaction& tx) {
    return ctx_.drafts->GetOne(tx, draft_id, resource_type, user_id);
  });
}

core::DraftPage DraftService::ListDrafts(int64_t user_id, model::ResourceType resource_type, db::DraftType draft_type,
                                         std::optional<int64_t> group_id, std::optional<int64_t> base_resource_id,
                                         int64_t page_start, int64_t page_length) {
  return RunInTransaction(*ctx_.repository, "DraftService.ListDrafts", [&](db::Transaction& tx) {
    return ctx_.drafts->GetByFiltersPaged(tx, draft_type, resource_type, user_id, group_id, base_resource_id,
                                          page_start, page_length);
  });
}

}
