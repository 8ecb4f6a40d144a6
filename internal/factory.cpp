#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/checks.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if DRAFTSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DRAFTSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace draftstore::factory {

namespace {

#if DRAFTSTORE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const draftstore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DRAFTSTORE_DB_SQLITE
    const auto& sqlite     = database.sqlite();
    const int   busy_ms    = sqlite.busy_timeout_ms() == 0 ? 5000 : static_cast<int>(sqlite.busy_timeout_ms());
    auto        sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode(), busy_ms);
    BootstrapSqliteSchema(sqlite_db);
    DRAFTSTORE_LOG_INFO("sqlite store ready", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DRAFTSTORE_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<db::postgres::PgPool>(
        postgres.connection_uri(), postgres.max_connections() == 0 ? 16 : postgres.max_connections());
    pool->Bootstrap(db::sql::PostgresSchema());
    DRAFTSTORE_LOG_INFO("postgres store ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DRAFTSTORE_LOG_INFO("memory store ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

void SeedDependencyRules(db::Repository& repository, const std::vector<model::DependencyRule>& rules) {
  auto tx = repository.Begin();
  for (const auto& rule : rules) {
    core::ThrowIfDbError(repository.InsertDependencyType(*tx, {rule.parent, rule.child}),
                         "seed rule " + model::ResourceTypeTag(rule.parent) + "->" + model::ResourceTypeTag(rule.child));
  }
  tx->Commit();
}

Application Build(std::shared_ptr<db::Repository> repository, const std::vector<model::DependencyRule>& rules) {
  SeedDependencyRules(*repository, rules);

  Application app;
  app.repository = std::move(repository);
  app.directory  = std::make_shared<core::Directory>(app.repository);
  app.resources  = std::make_shared<core::ResourceRepository>(app.repository);
  app.drafts     = std::make_shared<core::DraftsRepository>(app.repository);

  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.directory  = app.directory;
  ctx.resources  = app.resources;
  ctx.drafts     = app.drafts;

  app.draft_service    = std::make_shared<service::DraftService>(ctx);
  app.resource_service = std::make_shared<service::ResourceService>(ctx);
  return app;
}

/*
    Build full application dependency graph
*/
Application Build(const draftstore::runtime::config::RuntimeConfig& config) {
  auto rules = draftstore::config::ConfigLoader::DependencyRules(config);
  return Build(BuildRepository(config), rules);
}

} // namespace draftstore::factory
