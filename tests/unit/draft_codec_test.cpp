#include "internal/db/codec/draft_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace codec = draftstore::db::codec;
namespace dm    = draftstore::model;

google::protobuf::Struct ParseStruct(const std::string& json) {
  google::protobuf::Struct out;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &out);
  assert(status.ok());
  return out;
}

template <typename Fn>
bool ThrowsMalformed(Fn&& fn) {
  try {
    fn();
  } catch (const draftstore::util::MalformedDraft&) {
    return true;
  }
  return false;
}

void TestNewResourcePayloadWritesAllFourKeys() {
  dm::NewResourcePayload payload;
  payload.resource_data = ParseStruct(R"({"name":"q1"})");

  const auto blob = ParseStruct(codec::EncodeDraftPayload(payload));
  assert(blob.fields_size() == 4);
  assert(blob.fields().at("resource_data").struct_value().fields().at("name").string_value() == "q1");
  assert(blob.fields().at("resource_id").kind_case() == google::protobuf::Value::kNullValue);
  assert(blob.fields().at("resource_snapshot_id").kind_case() == google::protobuf::Value::kNullValue);
  assert(blob.fields().at("base_resource_id").kind_case() == google::protobuf::Value::kNullValue);
}

void TestModificationPayloadDecodes() {
  auto decoded = codec::DecodeDraftPayload(
      R"({"resource_data":{"k":1},"resource_id":7,"resource_snapshot_id":12,"base_resource_id":null})");
  const auto* mod = std::get_if<dm::ModificationPayload>(&decoded);
  assert(mod != nullptr);
  assert(mod->resource_id == 7);
  assert(mod->resource_snapshot_id == 12);
  assert(!mod->base_resource_id.has_value());
  assert(mod->resource_data.fields().at("k").number_value() == 1);
}

void TestDraftResourceWithBaseDecodes() {
  auto decoded = codec::DecodeDraftPayload(
      R"({"resource_data":{},"resource_id":null,"resource_snapshot_id":null,"base_resource_id":3})");
  const auto* created = std::get_if<dm::NewResourcePayload>(&decoded);
  assert(created != nullptr);
  assert(created->base_resource_id == 3);
}

void TestMalformedBlobsAreRejected() {
  // missing key
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(R"({"resource_data":{},"resource_id":null,"resource_snapshot_id":null})");
  }));
  // extra key
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":{},"resource_id":null,"resource_snapshot_id":null,"base_resource_id":null,"x":1})");
  }));
  // modification without a snapshot
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":{},"resource_id":4,"resource_snapshot_id":null,"base_resource_id":null})");
  }));
  // draft resource pinned to a snapshot
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":{},"resource_id":null,"resource_snapshot_id":9,"base_resource_id":null})");
  }));
  // non-integral id
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":{},"resource_id":1.5,"resource_snapshot_id":2,"base_resource_id":null})");
  }));
  // out of range ids must not wrap
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":{},"resource_id":9223372036854775808,"resource_snapshot_id":2,"base_resource_id":null})");
  }));
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":{},"resource_id":null,"resource_snapshot_id":null,"base_resource_id":-9223372036854775808})");
  }));
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":{},"resource_id":9007199254740994,"resource_snapshot_id":2,"base_resource_id":null})");
  }));
  // resource_data must be an object
  assert(ThrowsMalformed([] {
    codec::DecodeDraftPayload(
        R"({"resource_data":"text","resource_id":null,"resource_snapshot_id":null,"base_resource_id":null})");
  }));
  assert(ThrowsMalformed([] { codec::DecodeDraftPayload("not json"); }));
}

void TestRecordMirrorsPayloadIds() {
  dm::Draft draft;
  draft.draft_id              = 5;
  draft.resource_type         = draftstore::v1::RESOURCE_TYPE_JOB;
  draft.target_owner_group_id = 2;
  draft.creator_id            = 3;
  draft.created_on            = draftstore::util::FromUnixMillis(1000);
  draft.last_modified_on      = draftstore::util::FromUnixMillis(2000);

  dm::ModificationPayload payload;
  payload.resource_id          = 11;
  payload.resource_snapshot_id = 21;
  draft.payload                = payload;

  const auto record = codec::ToDraftRecord(draft);
  assert(record.resource_id == 11);
  assert(!record.base_resource_id.has_value());
  assert(record.created_on_ms == 1000);
  assert(record.last_modified_on_ms == 2000);

  const auto back = codec::FromDraftRecord(record);
  assert(back.draft_id == 5);
  assert(back.resource_type == draftstore::v1::RESOURCE_TYPE_JOB);
  assert(dm::IsModification(back));
  assert(dm::TargetResourceId(back) == 11);
}

} // namespace

int main() {
  TestNewResourcePayloadWritesAllFourKeys();
  TestModificationPayloadDecodes();
  TestDraftResourceWithBaseDecodes();
  TestMalformedBlobsAreRejected();
  TestRecordMirrorsPayloadIds();

  std::cout << "draftstore_unit_draft_codec: pass\n";
  return 0;
}
