#pragma once

#include <sqlite3.h>

#include <string>

namespace draftstore::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, bootstrap DDL, transaction control)
  void Exec(const std::string& sql);

  // Non-throwing variant for destructors; returns the sqlite rc.
  int TryExec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode, int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace draftstore::db::sqlite
