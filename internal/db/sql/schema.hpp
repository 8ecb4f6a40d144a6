#pragma once

#include <string>
#include <vector>

namespace draftstore::db::sql {

/*
  Idempotent bootstrap DDL, one statement per entry.

  Resource types are stored as text tags. The partial unique index on
  drafts enforces "one draft modification per (user, resource)" so that
  racing inserts turn into a constraint violation.
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace draftstore::db::sql
