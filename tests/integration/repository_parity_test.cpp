#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/codec/draft_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixture.hpp"

#if DRAFTSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if DRAFTSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using draftstore::db::DraftType;
using draftstore::db::ErrorCode;
using draftstore::db::Repository;
using draftstore::db::Transaction;
using draftstore::db::memory::MemoryRepository;
using draftstore::model::Draft;
using draftstore::model::ModificationPayload;
using draftstore::model::NewResourcePayload;
using draftstore::testing::Data;
using draftstore::testing::Throws;
using draftstore::testing::World;

namespace util = draftstore::util;
namespace v1   = draftstore::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Users and groups are unique by name and a postgres store outlives the run.
struct Names {
  std::string prefix;

  std::string operator()(const std::string& name) const {
    return prefix + "-" + name;
  }
};

Draft NewDraft(v1::ResourceType type, int64_t group, int64_t user, std::optional<int64_t> base = std::nullopt) {
  Draft draft;
  draft.resource_type         = type;
  draft.target_owner_group_id = group;
  draft.creator_id            = user;
  draft.payload               = NewResourcePayload{Data("{}"), base};
  return draft;
}

Draft ModDraft(v1::ResourceType type, int64_t group, int64_t user, int64_t resource_id, int64_t snapshot_id) {
  Draft draft;
  draft.resource_type         = type;
  draft.target_owner_group_id = group;
  draft.creator_id            = user;
  ModificationPayload payload;
  payload.resource_data        = Data(R"({"name":"edit"})");
  payload.resource_id          = resource_id;
  payload.resource_snapshot_id = snapshot_id;
  draft.payload                = payload;
  return draft;
}

void VerifyDraftScenarios(const std::shared_ptr<Repository>& repo, const Names& names) {
  World world(repo);
  auto& drafts = *world.app.drafts;

  const auto alice = world.User(names("alice"));
  const auto bob   = world.User(names("bob"));
  const auto group = world.Group(names("lab"), alice);
  world.Join(group, bob);

  // new queue draft is listed
  auto queue_draft = NewDraft(v1::RESOURCE_TYPE_QUEUE, group, alice);
  world.InTx([&](Transaction& tx) { drafts.CreateDraftResource(tx, queue_draft); });
  world.InTx([&](Transaction& tx) {
    const auto page = drafts.GetByFiltersPaged(tx, DraftType::kResource, v1::RESOURCE_TYPE_QUEUE, alice);
    assert(page.total == 1);
    assert(page.drafts.front().draft_id == queue_draft.draft_id);
  });

  // duplicate modification
  const auto q  = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice);
  const auto id = q.resource.resource_id;
  auto first    = ModDraft(v1::RESOURCE_TYPE_QUEUE, group, alice, id, q.snapshot.snapshot_id);
  world.InTx([&](Transaction& tx) { drafts.CreateDraftModification(tx, first); });
  assert(Throws<util::DraftAlreadyExists>([&] {
    auto again = ModDraft(v1::RESOURCE_TYPE_QUEUE, group, alice, id, q.snapshot.snapshot_id);
    world.InTx([&](Transaction& tx) { drafts.CreateDraftModification(tx, again); });
  }));
  world.InTx([&](Transaction& tx) {
    const auto stored = drafts.GetOne(tx, first.draft_id);
    assert(draftstore::model::ResourceData(stored).fields().at("name").string_value() == "edit");
  });

  // snapshot of another resource
  const auto q2 = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice);
  assert(Throws<util::DraftSnapshotIdInvalid>([&] {
    world.InTx([&](Transaction& tx) { drafts.Update(tx, first, Data("{}"), q2.snapshot.snapshot_id); });
  }));
  world.InTx([&](Transaction& tx) {
    const auto stored = drafts.GetOne(tx, first.draft_id);
    assert(std::get<ModificationPayload>(stored.payload).resource_snapshot_id == q.snapshot.snapshot_id);
  });

  // membership
  const auto q3 = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice);
  world.InTx([&](Transaction& tx) {
    const std::vector<int64_t> ids{q2.resource.resource_id, id, q3.resource.resource_id};
    assert(drafts.HasDraftModifications(tx, ids) == std::set<int64_t>{id});
  });

  // illegal base pair
  const auto experiment = world.Resource(v1::RESOURCE_TYPE_EXPERIMENT, group, alice).resource.resource_id;
  assert(Throws<util::DraftBaseInvalid>([&] {
    auto job = NewDraft(v1::RESOURCE_TYPE_JOB, group, alice, experiment);
    world.InTx([&](Transaction& tx) { drafts.CreateDraftResource(tx, job); });
  }));

  // deleted target
  world.app.resource_service->DeleteResource(id);
  assert(world.app.resource_service->GetResource(id).is_deleted);
  assert(Throws<util::EntityDeleted>([&] {
    auto late = ModDraft(v1::RESOURCE_TYPE_QUEUE, group, bob, id, q.snapshot.snapshot_id);
    world.InTx([&](Transaction& tx) { drafts.CreateDraftModification(tx, late); });
  }));
}

void VerifyCommitFlow(const std::shared_ptr<Repository>& repo, const Names& names) {
  World world(repo);
  auto& svc = *world.app.draft_service;

  const auto alice = world.User(names("committer"));
  const auto group = world.Group(names("committers"), alice);
  const auto entry = world.Resource(v1::RESOURCE_TYPE_ENTRY_POINT, group, alice).resource.resource_id;

  const auto draft     = svc.CreateDraft(alice, v1::RESOURCE_TYPE_JOB, std::nullopt, entry, Data(R"({"k":1})"));
  const auto committed = svc.CommitDraft(alice, draft.draft_id);
  assert(committed.resource.group_id == group);

  const auto mod = svc.CreateModification(alice, v1::RESOURCE_TYPE_JOB, committed.resource.resource_id,
                                          Data(R"({"k":2})"));
  svc.CommitDraft(alice, mod.draft.draft_id);

  const auto history = world.app.resource_service->GetHistory(committed.resource.resource_id);
  assert(history.size() == 2);
  assert(draftstore::db::codec::DecodeResourceData(history.back().data).fields().at("k").number_value() == 2);

  world.InTx([&](Transaction& tx) {
    const auto children = world.app.resources->GetChildren(tx, entry);
    assert(children.size() == 1);
    assert(children.front().child_resource_id == committed.resource.resource_id);
  });
}

// Direct store checks below the repositories.
void VerifyModificationUniqueness(const std::shared_ptr<Repository>& repo, const Names& names) {
  World      world(repo);
  const auto alice = world.User(names("unique"));
  const auto group = world.Group(names("unique-lab"), alice);
  const auto q     = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice);

  auto record = draftstore::db::codec::ToDraftRecord(
      ModDraft(v1::RESOURCE_TYPE_QUEUE, group, alice, q.resource.resource_id, q.snapshot.snapshot_id));
  {
    auto tx = repo->Begin();
    assert(repo->InsertDraft(*tx, record));
    tx->Commit();
  }

  auto duplicate     = record;
  duplicate.draft_id = 0;
  auto tx            = repo->Begin();
  auto result        = repo->InsertDraft(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifyRollbackBehavior(const std::shared_ptr<Repository>& repo, const Names& names) {
  World      world(repo);
  const auto alice = world.User(names("rollback"));
  const auto group = world.Group(names("rollback-lab"), alice);

  int64_t draft_id = 0;
  {
    auto tx     = repo->Begin();
    auto record = draftstore::db::codec::ToDraftRecord(NewDraft(v1::RESOURCE_TYPE_PLUGIN, group, alice));
    assert(repo->InsertDraft(*tx, record));
    draft_id = record.draft_id;
    assert(repo->GetDraft(*tx, draft_id).has_value());
    tx->Rollback();
  }

  auto check_tx = repo->Begin();
  assert(!repo->GetDraft(*check_tx, draft_id).has_value());
  check_tx->Commit();
}

void VerifyPagingAndParentCheck(const std::shared_ptr<Repository>& repo, const Names& names) {
  World      world(repo);
  const auto alice = world.User(names("pager"));
  const auto group = world.Group(names("pager-lab"), alice);
  const auto entry = world.Resource(v1::RESOURCE_TYPE_ENTRY_POINT, group, alice).resource.resource_id;

  std::vector<int64_t> ids;
  for (int i = 0; i < 4; ++i) {
    auto draft = NewDraft(v1::RESOURCE_TYPE_PLUGIN, group, alice, entry);
    world.InTx([&](Transaction& tx) { world.app.drafts->CreateDraftResource(tx, draft); });
    ids.push_back(draft.draft_id);
  }

  auto tx = repo->Begin();

  draftstore::db::DraftFilter filter;
  filter.draft_type       = DraftType::kResource;
  filter.user_id          = alice;
  filter.base_resource_id = entry;
  assert(repo->CountDrafts(*tx, filter) == 4);

  const auto page = repo->FindDrafts(*tx, filter, draftstore::db::Pagination{1, 2});
  assert(page.size() == 2);
  assert(page[0].draft_id == ids[1]);
  assert(page[1].draft_id == ids[2]);

  filter.draft_type = DraftType::kModification;
  assert(repo->CountDrafts(*tx, filter) == 0);

  const auto legal = repo->CheckParentType(*tx, entry, v1::RESOURCE_TYPE_JOB);
  assert(legal && legal->legal && !legal->is_deleted);
  assert(legal->parent_type == v1::RESOURCE_TYPE_ENTRY_POINT);

  const auto illegal = repo->CheckParentType(*tx, entry, v1::RESOURCE_TYPE_EXPERIMENT);
  assert(illegal && !illegal->legal);

  assert(!repo->CheckParentType(*tx, entry + 100000, v1::RESOURCE_TYPE_JOB).has_value());
  tx->Commit();
}

void VerifyRacingModifications(const std::shared_ptr<Repository>& repo, const Names& names,
                               bool supports_parallel_transactions) {
  World      world(repo);
  const auto alice = world.User(names("racer"));
  const auto group = world.Group(names("racers"), alice);
  const auto q     = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice);

  auto tx1 = repo->Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo->Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo->Begin();

  auto r1 = draftstore::db::codec::ToDraftRecord(
      ModDraft(v1::RESOURCE_TYPE_QUEUE, group, alice, q.resource.resource_id, q.snapshot.snapshot_id));
  auto r2 = r1;

  assert(repo->InsertDraft(*tx1, r1));
  tx1->Commit();

  // the loser fails at insert or at commit, never silently
  bool second_failed = !repo->InsertDraft(*tx2, r2);
  if (!second_failed) {
    try {
      tx2->Commit();
    } catch (const std::exception&) {
      second_failed = true;
    }
  }
  assert(second_failed);
  if (!tx2->IsCommitted()) tx2->Rollback();

  auto verify_tx = repo->Begin();
  draftstore::db::DraftFilter filter;
  filter.draft_type  = DraftType::kModification;
  filter.resource_id = q.resource.resource_id;
  assert(repo->CountDrafts(*verify_tx, filter) == 1);
  verify_tx->Commit();
}

void VerifyReadOnlyCommitDoesNotBlockWriter(const std::shared_ptr<Repository>& repo, const Names& names,
                                             bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  World      world(repo);
  const auto known = world.User(names("reader"));

  auto writer = repo->Begin();
  draftstore::db::model::UserRecord user;
  user.username      = names("reader-writer");
  user.created_on_ms = NowMs();
  assert(repo->InsertUser(*writer, user));

  // a reader that commits first leaves the writer's snapshot valid
  {
    auto reader = repo->Begin();
    assert(repo->GetUser(*reader, known).has_value());
    reader->Commit();
  }

  writer->Commit();
  assert(writer->IsCommitted());

  auto check = repo->Begin();
  assert(repo->GetUser(*check, user.user_id).has_value());
  check->Commit();
}

void VerifyLongModificationLookup(const std::shared_ptr<Repository>& repo, const Names& names) {
  World      world(repo);
  const auto alice = world.User(names("lookup"));
  const auto group = world.Group(names("lookup-lab"), alice);
  const auto q     = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice);
  const auto id    = q.resource.resource_id;

  auto draft = ModDraft(v1::RESOURCE_TYPE_QUEUE, group, alice, id, q.snapshot.snapshot_id);
  world.InTx([&](Transaction& tx) { world.app.drafts->CreateDraftModification(tx, draft); });

  // far more ids than a statement accepts as separate parameters
  std::vector<int64_t> ids;
  for (int64_t i = 1; i <= 40000; ++i) ids.push_back(-i);
  ids.push_back(id);

  auto tx = repo->Begin();
  assert(repo->ResourcesWithDraftModifications(*tx, ids, std::nullopt) == std::vector<int64_t>{id});
  assert(repo->ResourcesWithDraftModifications(*tx, ids, alice) == std::vector<int64_t>{id});
  assert(repo->ResourcesWithDraftModifications(*tx, ids, alice + 100000).empty());
  tx->Commit();
}

void VerifyExplicitDraftIdAdvancesAllocation(const std::shared_ptr<Repository>& repo, const Names& names) {
  World      world(repo);
  const auto alice = world.User(names("allocator"));
  const auto group = world.Group(names("allocator-lab"), alice);

  auto insert = [&](int64_t draft_id) {
    auto record     = draftstore::db::codec::ToDraftRecord(NewDraft(v1::RESOURCE_TYPE_PLUGIN, group, alice));
    record.draft_id = draft_id;
    auto tx         = repo->Begin();
    assert(repo->InsertDraft(*tx, record));
    tx->Commit();
    return record.draft_id;
  };

  const auto assigned    = insert(0);
  const auto explicit_id = assigned + 1000;
  assert(insert(explicit_id) == explicit_id);
  assert(insert(0) > explicit_id);
}

void VerifyRestartDurability(BackendFactory& backend, const Names& names) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();

  int64_t resource_id = 0;
  int64_t draft_id    = 0;
  {
    World      world(repo);
    const auto alice = world.User(names("durable"));
    const auto group = world.Group(names("durable-lab"), alice);
    const auto q     = world.Resource(v1::RESOURCE_TYPE_QUEUE, group, alice, R"({"name":"kept"})");
    resource_id      = q.resource.resource_id;
    draft_id         = world.app.draft_service
                   ->CreateModification(alice, v1::RESOURCE_TYPE_QUEUE, resource_id, Data("{}"))
                   .draft.draft_id;
    world.app.resource_service->LockResource(resource_id, {v1::RESOURCE_LOCK_TYPE_READONLY});
  }

  backend.restart(repo);

  auto tx       = repo->Begin();
  auto resource = repo->GetResource(*tx, resource_id);
  assert(resource.has_value());
  assert(resource->is_readonly);
  assert(!resource->is_deleted);

  auto draft = repo->GetDraft(*tx, draft_id);
  assert(draft.has_value());
  assert(draft->resource_id == resource_id);
  assert(!repo->ListDependencyTypes(*tx).empty());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if DRAFTSTORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("draftstore_integration_sqlite_" + std::to_string(NowMs()) + ".db"))
          .string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<draftstore::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : draftstore::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<draftstore::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if DRAFTSTORE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DRAFTSTORE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DRAFTSTORE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<draftstore::db::postgres::PgPool>(conninfo);
    pool->Bootstrap(draftstore::db::sql::PostgresSchema());
    return std::make_shared<draftstore::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto        repo = backend.make_repository();
  const Names names{backend.name + "-" + std::to_string(NowMs())};

  VerifyDraftScenarios(repo, names);
  VerifyCommitFlow(repo, names);
  VerifyModificationUniqueness(repo, names);
  VerifyRollbackBehavior(repo, names);
  VerifyPagingAndParentCheck(repo, names);
  VerifyRacingModifications(repo, names, backend.supports_parallel_transactions);
  VerifyReadOnlyCommitDoesNotBlockWriter(repo, names, backend.supports_parallel_transactions);
  VerifyLongModificationLookup(repo, names);
  VerifyExplicitDraftIdAdvancesAllocation(repo, names);

  // the restarted store reopens the same file
  repo.reset();
  VerifyRestartDurability(backend, names);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DRAFTSTORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if DRAFTSTORE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "draftstore_integration_repository_parity: pass\n";
  return 0;
}
