#include "draft_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace draftstore::db::codec {

namespace dm = draftstore::model;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

constexpr const char* kResourceData       = "resource_data";
constexpr const char* kResourceId         = "resource_id";
constexpr const char* kResourceSnapshotId = "resource_snapshot_id";
constexpr const char* kBaseResourceId     = "base_resource_id";

Value IdValue(std::optional<int64_t> id) {
  Value v;
  if (id.has_value()) {
    v.set_number_value(static_cast<double>(*id));
  } else {
    v.set_null_value(google::protobuf::NULL_VALUE);
  }
  return v;
}

std::optional<int64_t> ReadId(const Struct& blob, const char* key) {
  const auto& fields = blob.fields();
  auto        it     = fields.find(key);
  if (it == fields.end()) {
    throw util::MalformedDraft(std::string("draft payload is missing key '") + key + "'");
  }

  const Value& v = it->second;
  if (v.kind_case() == Value::kNullValue) return std::nullopt;
  if (v.kind_case() != Value::kNumberValue) {
    throw util::MalformedDraft(std::string("draft payload key '") + key + "' must be an integer or null");
  }

  // Ids beyond 2^53 are not exact as JSON numbers.
  constexpr double kMaxExactId = 9007199254740992.0;

  const double n = v.number_value();
  if (std::floor(n) != n || std::fabs(n) > kMaxExactId) {
    throw util::MalformedDraft(std::string("draft payload key '") + key + "' must be an integer or null");
  }
  return static_cast<int64_t>(n);
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON: " + std::string(status.message()));
  }
  return json;
}

Struct ParseObject(const std::string& json, const char* what) {
  Struct out;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &out);
  if (!status.ok()) {
    throw util::MalformedDraft(std::string(what) + " is not a JSON object: " + std::string(status.message()));
  }
  return out;
}

} // namespace

std::string EncodeDraftPayload(const dm::DraftPayload& payload) {
  Struct blob;
  auto&  fields = *blob.mutable_fields();

  std::visit(
      [&fields](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        *fields[kResourceData].mutable_struct_value() = p.resource_data;
        fields[kBaseResourceId]                       = IdValue(p.base_resource_id);
        if constexpr (std::is_same_v<T, dm::ModificationPayload>) {
          fields[kResourceId]         = IdValue(p.resource_id);
          fields[kResourceSnapshotId] = IdValue(p.resource_snapshot_id);
        } else {
          fields[kResourceId]         = IdValue(std::nullopt);
          fields[kResourceSnapshotId] = IdValue(std::nullopt);
        }
      },
      payload);

  return ToJson(blob);
}

dm::DraftPayload DecodeDraftPayload(const std::string& json) {
  const Struct blob = ParseObject(json, "draft payload");

  if (blob.fields_size() != 4) {
    throw util::MalformedDraft("draft payload must have exactly the keys resource_data, resource_id, "
                               "resource_snapshot_id, base_resource_id");
  }

  auto data_it = blob.fields().find(kResourceData);
  if (data_it == blob.fields().end() || data_it->second.kind_case() != Value::kStructValue) {
    throw util::MalformedDraft("draft payload key 'resource_data' must be an object");
  }

  const auto resource_id = ReadId(blob, kResourceId);
  const auto snapshot_id = ReadId(blob, kResourceSnapshotId);
  const auto base_id     = ReadId(blob, kBaseResourceId);

  if (!resource_id.has_value()) {
    if (snapshot_id.has_value()) {
      throw util::MalformedDraft("draft resource must not carry a resource_snapshot_id");
    }
    return dm::NewResourcePayload{data_it->second.struct_value(), base_id};
  }

  if (!snapshot_id.has_value()) {
    throw util::MalformedDraft("draft modification of resource " + std::to_string(*resource_id) +
                               " has no resource_snapshot_id");
  }
  return dm::ModificationPayload{data_it->second.struct_value(), *resource_id, *snapshot_id, base_id};
}

model::DraftRecord ToDraftRecord(const dm::Draft& draft) {
  model::DraftRecord r;
  r.draft_id            = draft.draft_id;
  r.group_id            = draft.target_owner_group_id;
  r.resource_type       = draft.resource_type;
  r.user_id             = draft.creator_id;
  r.payload             = EncodeDraftPayload(draft.payload);
  r.created_on_ms       = util::ToUnixMillis(draft.created_on);
  r.last_modified_on_ms = util::ToUnixMillis(draft.last_modified_on);
  r.resource_id         = dm::TargetResourceId(draft);
  r.base_resource_id    = dm::BaseResourceId(draft);
  return r;
}

dm::Draft FromDraftRecord(const model::DraftRecord& record) {
  dm::Draft d;
  d.draft_id              = record.draft_id;
  d.resource_type         = record.resource_type;
  d.target_owner_group_id = record.group_id;
  d.creator_id            = record.user_id;
  d.created_on            = util::FromUnixMillis(record.created_on_ms);
  d.last_modified_on      = util::FromUnixMillis(record.last_modified_on_ms);
  d.payload               = DecodeDraftPayload(record.payload);
  return d;
}

std::string EncodeResourceData(const Struct& data) {
  return ToJson(data);
}

Struct DecodeResourceData(const std::string& json) {
  return ParseObject(json, "resource data");
}

} // namespace draftstore::db::codec
