#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <variant>

#include "internal/model/resource_type.hpp"
#include "internal/util/time.hpp"

namespace draftstore::model {

/*
  Draft payload variants.

  A draft either proposes a brand-new resource (optionally attached under
  a base resource once committed) or a new snapshot of an existing
  resource, pinned to the snapshot it was branched from. A modification
  without a target is not representable.
*/

struct NewResourcePayload {
  google::protobuf::Struct resource_data;
  std::optional<int64_t>   base_resource_id;
};

struct ModificationPayload {
  google::protobuf::Struct resource_data;
  int64_t                  resource_id          = 0;
  int64_t                  resource_snapshot_id = 0;
  // carried through from the persisted blob; not validated for modifications
  std::optional<int64_t> base_resource_id;
};

using DraftPayload = std::variant<NewResourcePayload, ModificationPayload>;

struct Draft {
  int64_t      draft_id = 0; // 0 = not yet persisted
  ResourceType resource_type         = draftstore::v1::RESOURCE_TYPE_UNSPECIFIED;
  int64_t      target_owner_group_id = 0;
  int64_t      creator_id            = 0;

  util::TimePoint created_on{};
  util::TimePoint last_modified_on{};

  DraftPayload payload;
};

inline bool IsModification(const Draft& draft) {
  return std::holds_alternative<ModificationPayload>(draft.payload);
}

inline const google::protobuf::Struct& ResourceData(const Draft& draft) {
  return std::visit([](const auto& p) -> const google::protobuf::Struct& { return p.resource_data; }, draft.payload);
}

inline google::protobuf::Struct& MutableResourceData(Draft& draft) {
  return std::visit([](auto& p) -> google::protobuf::Struct& { return p.resource_data; }, draft.payload);
}

inline std::optional<int64_t> BaseResourceId(const Draft& draft) {
  return std::visit([](const auto& p) { return p.base_resource_id; }, draft.payload);
}

// resource_id of the modified resource; nullopt for draft resources
inline std::optional<int64_t> TargetResourceId(const Draft& draft) {
  if (const auto* mod = std::get_if<ModificationPayload>(&draft.payload)) {
    return mod->resource_id;
  }
  return std::nullopt;
}

} // namespace draftstore::model
