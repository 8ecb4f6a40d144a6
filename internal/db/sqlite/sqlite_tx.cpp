#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace draftstore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  const int rc = db_->TryExec("ROLLBACK;");
  if (rc != SQLITE_OK) {
    DRAFTSTORE_LOG_WARN("sqlite rollback failed", {draftstore::observability::StringField("path", db_->Path()),
                                                   draftstore::observability::StringField("error", sqlite3_errstr(rc))});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace draftstore::db::sqlite
