#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>

#include "internal/core/drafts_repository.hpp"
#include "internal/core/resource_repository.hpp"
#include "internal/model/draft.hpp"
#include "service_context.hpp"

namespace draftstore::service {

struct ModificationCreated {
  model::Draft draft;
  uint64_t     num_other_drafts = 0; // pending modifications by other users
};

/*
  Caller-side orchestration of the drafts repository. Every method is one
  transaction: begin, validate and write through the repositories, commit.
*/
class DraftService {
public:
  explicit DraftService(ServiceContext ctx);

  // Owner is the base resource's group when a base is given, else group_id.
  model::Draft CreateDraft(int64_t user_id, model::ResourceType resource_type, std::optional<int64_t> group_id,
                           std::optional<int64_t> base_resource_id, const google::protobuf::Struct& data);

  // Pins the resource's latest snapshot.
  ModificationCreated CreateModification(int64_t user_id, model::ResourceType resource_type, int64_t resource_id,
                                         const google::protobuf::Struct& data);

  model::Draft ModifyDraft(int64_t user_id, int64_t draft_id, const google::protobuf::Struct& data,
                           std::optional<int64_t> resource_snapshot_id = std::nullopt);

  void DeleteDraft(int64_t user_id, int64_t draft_id);

  // Promotes the draft into a resource / snapshot and removes it.
  core::ResourceRepository::Created CommitDraft(int64_t user_id, int64_t draft_id);

  model::Draft GetDraft(int64_t user_id, int64_t draft_id,
                        std::optional<model::ResourceType> resource_type = std::nullopt);

  core::DraftPage ListDrafts(int64_t user_id, model::ResourceType resource_type, db::DraftType draft_type,
                             std::optional<int64_t> group_id = std::nullopt,
                             std::optional<int64_t> base_resource_id = std::nullopt, int64_t page_start = 0,
                             int64_t page_length = -1);

private:
  ServiceContext ctx_;
};

}
