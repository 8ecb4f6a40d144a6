#include "internal/core/checks.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "tests/support/fixture.hpp"

namespace {

using namespace draftstore;
using draftstore::core::DeletionPolicy;
using draftstore::core::ExistenceResult;
using draftstore::testing::Throws;
using draftstore::testing::World;

void TestExistenceStates() {
  World world;
  const auto alice = world.User("alice");
  const auto bob   = world.User("bob");
  const auto group = world.Group("lab", alice);

  {
    auto tx = world.Repo().Begin();
    world.app.directory->DeleteUser(*tx, bob);
    tx->Commit();
  }

  auto tx = world.Repo().Begin();
  assert(core::UserExists(world.Repo(), *tx, alice) == ExistenceResult::Exists);
  assert(core::UserExists(world.Repo(), *tx, bob) == ExistenceResult::Deleted);
  assert(core::UserExists(world.Repo(), *tx, 999) == ExistenceResult::DoesNotExist);
  assert(core::GroupExists(world.Repo(), *tx, group) == ExistenceResult::Exists);
  assert(core::ResourceExists(world.Repo(), *tx, 1) == ExistenceResult::DoesNotExist);
  assert(!core::SnapshotExists(world.Repo(), *tx, 1));
  assert(!core::DraftExists(world.Repo(), *tx, 1));
}

void TestDeletionPolicies() {
  World world;
  const auto alice = world.User("alice");
  const auto bob   = world.User("bob");
  {
    auto tx = world.Repo().Begin();
    world.app.directory->DeleteUser(*tx, bob);
    tx->Commit();
  }

  auto  tx   = world.Repo().Begin();
  auto& repo = world.Repo();

  core::AssertUserExists(repo, *tx, alice, DeletionPolicy::NotDeleted);
  core::AssertUserExists(repo, *tx, alice, DeletionPolicy::Any);
  core::AssertUserExists(repo, *tx, bob, DeletionPolicy::Any);
  core::AssertUserExists(repo, *tx, bob, DeletionPolicy::Deleted);

  assert(Throws<util::EntityDeleted>([&] { core::AssertUserExists(repo, *tx, bob, DeletionPolicy::NotDeleted); }));
  assert(Throws<util::AlreadyExists>([&] { core::AssertUserExists(repo, *tx, alice, DeletionPolicy::Deleted); }));
  assert(Throws<util::NotFound>([&] { core::AssertUserExists(repo, *tx, 404, DeletionPolicy::Any); }));
  assert(Throws<util::NotFound>([&] { core::AssertGroupExists(repo, *tx, 404, DeletionPolicy::NotDeleted); }));
  assert(Throws<util::NotFound>([&] { core::AssertSnapshotExists(repo, *tx, 404); }));
  assert(Throws<util::DraftDoesNotExist>([&] { core::AssertDraftExists(repo, *tx, 404); }));

  // not yet persisted
  core::AssertDraftDoesNotExist(repo, *tx, 0);
}

void TestMembershipAndReadOnly() {
  World world;
  const auto alice = world.User("alice");
  const auto bob   = world.User("bob");
  const auto group = world.Group("lab", alice);
  const auto queue = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice);

  world.app.resource_service->LockResource(queue.resource.resource_id, {v1::RESOURCE_LOCK_TYPE_READONLY});

  auto  tx   = world.Repo().Begin();
  auto& repo = world.Repo();

  core::AssertUserInGroup(repo, *tx, alice, group);
  assert(Throws<util::UserNotInGroup>([&] { core::AssertUserInGroup(repo, *tx, bob, group); }));

  assert(!core::ResourceModifiable(repo, *tx, queue.resource.resource_id));
  assert(Throws<util::ReadOnlyLock>([&] { core::AssertResourceModifiable(repo, *tx, queue.resource.resource_id); }));
}

void TestStoreErrorTranslation() {
  core::ThrowIfDbError(db::Result::Ok(), "ok");

  assert(Throws<util::NotFound>([] { core::ThrowIfDbError(db::Result::Err(db::ErrorCode::NotFound), "x"); }));
  assert(Throws<util::AlreadyExists>([] { core::ThrowIfDbError(db::Result::Err(db::ErrorCode::AlreadyExists), "x"); }));
  assert(Throws<util::Conflict>(
      [] { core::ThrowIfDbError(db::Result::Err(db::ErrorCode::ConstraintViolation), "x"); }));
  assert(Throws<util::Conflict>([] { core::ThrowIfDbError(db::Result::Err(db::ErrorCode::Busy), "x"); }));
  assert(Throws<std::runtime_error>(
      [] { core::ThrowIfDbError(db::Result::Err(db::ErrorCode::InternalError, "boom"), "x"); }));
}

} // namespace

int main() {
  TestExistenceStates();
  TestDeletionPolicies();
  TestMembershipAndReadOnly();
  TestStoreErrorTranslation();

  std::cout << "draftstore_unit_checks: pass\n";
  return 0;
}
