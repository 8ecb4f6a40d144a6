#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "internal/db/model/draft_record.hpp"
#include "internal/model/draft.hpp"

namespace draftstore::db::codec {

/*
  Draft <-> row conversion.

  The persisted payload is a JSON object with exactly four keys:

    resource_data         object
    resource_id           integer | null
    resource_snapshot_id  integer | null
    base_resource_id      integer | null

  resource_id decides the variant. Anything else (missing keys, extra
  keys, a modification without a snapshot id, a draft resource with one)
  is rejected with util::MalformedDraft.
*/

std::string                EncodeDraftPayload(const draftstore::model::DraftPayload& payload);
draftstore::model::DraftPayload DecodeDraftPayload(const std::string& json);

model::DraftRecord       ToDraftRecord(const draftstore::model::Draft& draft);
draftstore::model::Draft FromDraftRecord(const model::DraftRecord& record);

// Snapshot / resource data bodies.
std::string              EncodeResourceData(const google::protobuf::Struct& data);
google::protobuf::Struct DecodeResourceData(const std::string& json);

} // namespace draftstore::db::codec
