#include "internal/core/resource_repository.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/db/codec/draft_codec.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixture.hpp"

namespace {

using namespace draftstore;
using draftstore::testing::Data;
using draftstore::testing::Throws;
using draftstore::testing::World;

void TestCreateWritesFirstSnapshot() {
  World world;
  const auto alice = world.User("alice");
  const auto group = world.Group("lab", alice);

  const auto created = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice, R"({"name":"q1"})");
  assert(created.resource.resource_id > 0);
  assert(created.snapshot.resource_id == created.resource.resource_id);
  assert(created.resource.latest_snapshot_id == created.snapshot.snapshot_id);

  const auto stored = world.app.resource_service->GetResource(created.resource.resource_id);
  assert(stored.group_id == group);
  assert(stored.resource_type == v1::RESOURCE_TYPE_QUEUE);
  assert(stored.latest_snapshot_id == created.snapshot.snapshot_id);
  assert(!stored.is_deleted);
  assert(!stored.is_readonly);

  const auto data = db::codec::DecodeResourceData(created.snapshot.data);
  assert(data.fields().at("name").string_value() == "q1");
}

void TestCreateRejectsOutsiders() {
  World world;
  const auto alice = world.User("alice");
  const auto bob   = world.User("bob");
  const auto group = world.Group("lab", alice);

  assert(Throws<util::UserNotInGroup>([&] { world.Resource(v1::RESOURCE_TYPE_QUEUE, group, bob); }));
  assert(Throws<util::NotFound>([&] { world.Resource(v1::RESOURCE_TYPE_QUEUE, 404, alice); }));
  assert(Throws<std::invalid_argument>([&] { world.Resource(v1::RESOURCE_TYPE_UNSPECIFIED, group, alice); }));
}

void TestSnapshotsAppendOnly() {
  World world;
  const auto alice = world.User("alice");
  const auto group = world.Group("lab", alice);
  const auto job   = world.Resource(v1::RESOURCE_TYPE_JOB, group, alice, R"({"v":1})");
  const auto id    = job.resource.resource_id;

  const auto second = world.app.resource_service->AddSnapshot(id, alice, Data(R"({"v":2})"), "bump");
  assert(second.snapshot_id > job.snapshot.snapshot_id);
  assert(world.app.resource_service->GetResource(id).latest_snapshot_id == second.snapshot_id);

  const auto history = world.app.resource_service->GetHistory(id);
  assert(history.size() == 2);
  assert(history.front().snapshot_id == job.snapshot.snapshot_id);
  assert(history.back().description == "bump");
}

void TestReadOnlyAndDelete() {
  World world;
  const auto alice = world.User("alice");
  const auto group = world.Group("lab", alice);
  const auto frozen = world.Resource(v1::RESOURCE_TYPE_ARTIFACT, group, alice);
  const auto doomed = world.Resource(v1::RESOURCE_TYPE_ARTIFACT, group, alice);
  auto&      svc    = *world.app.resource_service;

  svc.LockResource(frozen.resource.resource_id, {v1::RESOURCE_LOCK_TYPE_READONLY});
  // repeated lock types are skipped
  svc.LockResource(frozen.resource.resource_id, {v1::RESOURCE_LOCK_TYPE_READONLY});
  assert(svc.GetResource(frozen.resource.resource_id).is_readonly);

  assert(Throws<util::ReadOnlyLock>([&] { svc.AddSnapshot(frozen.resource.resource_id, alice, Data("{}")); }));
  assert(Throws<util::ReadOnlyLock>([&] { svc.DeleteResource(frozen.resource.resource_id); }));
  assert(Throws<util::ReadOnlyLock>(
      [&] { svc.LockResource(frozen.resource.resource_id, {v1::RESOURCE_LOCK_TYPE_DELETE}); }));

  svc.DeleteResource(doomed.resource.resource_id);
  svc.DeleteResource(doomed.resource.resource_id);
  assert(svc.GetResource(doomed.resource.resource_id).is_deleted);
  assert(Throws<util::EntityDeleted>([&] { svc.AddSnapshot(doomed.resource.resource_id, alice, Data("{}")); }));
  assert(Throws<util::NotFound>([&] { svc.DeleteResource(404); }));

  // history survives deletion
  assert(svc.GetHistory(doomed.resource.resource_id).size() == 1);

  auto tx    = world.Repo().Begin();
  auto locks = world.app.resources->GetLockTypes(*tx, doomed.resource.resource_id);
  assert(locks.size() == 1 && locks.front() == v1::RESOURCE_LOCK_TYPE_DELETE);
  assert(world.app.resources->GetResource(*tx, doomed.resource.resource_id, core::DeletionPolicy::Deleted));
  assert(!world.app.resources->GetResource(*tx, doomed.resource.resource_id));
}

void TestAppendChildFollowsRules() {
  World world;
  const auto alice      = world.User("alice");
  const auto group      = world.Group("lab", alice);
  const auto experiment = world.Resource(v1::RESOURCE_TYPE_EXPERIMENT, group, alice).resource.resource_id;
  const auto entry      = world.Resource(v1::RESOURCE_TYPE_ENTRY_POINT, group, alice).resource.resource_id;
  const auto job        = world.Resource(v1::RESOURCE_TYPE_JOB, group, alice).resource.resource_id;
  auto&      svc        = *world.app.resource_service;

  svc.AppendChild(experiment, entry);
  svc.AppendChild(entry, job);
  // re-linking is skipped
  svc.AppendChild(entry, job);

  assert(Throws<util::InvalidRelationship>([&] { svc.AppendChild(experiment, job); }));
  assert(Throws<util::InvalidRelationship>([&] { svc.AppendChild(job, job); }));
  assert(Throws<util::NotFound>([&] { svc.AppendChild(404, job); }));

  {
    auto tx       = world.Repo().Begin();
    auto children = world.app.resources->GetChildren(*tx, experiment);
    assert(children.size() == 1);
    assert(children.front().child_resource_id == entry);
    assert(children.front().child_resource_type == v1::RESOURCE_TYPE_ENTRY_POINT);

    auto parents = world.app.resources->GetParents(*tx, job);
    assert(parents.size() == 1 && parents.front().parent_resource_id == entry);

    world.app.resources->UnlinkChild(*tx, entry, job);
    assert(world.app.resources->GetParents(*tx, job).empty());

    // unlinking a pair that is not linked is a no-op
    world.app.resources->UnlinkChild(*tx, entry, job);
    world.app.resources->UnlinkChild(*tx, experiment, job);
    assert(Throws<util::NotFound>([&] { world.app.resources->UnlinkChild(*tx, 404, job); }));
    assert(Throws<util::NotFound>([&] { world.app.resources->UnlinkChild(*tx, entry, 404); }));
    tx->Commit();
  }

  svc.DeleteResource(entry);
  assert(Throws<util::EntityDeleted>([&] { svc.AppendChild(entry, job); }));
}

} // namespace

int main() {
  TestCreateWritesFirstSnapshot();
  TestCreateRejectsOutsiders();
  TestSnapshotsAppendOnly();
  TestReadOnlyAndDelete();
  TestAppendChildFollowsRules();

  std::cout << "draftstore_unit_resource_repository: pass\n";
  return 0;
}
