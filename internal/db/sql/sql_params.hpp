#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace draftstore::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both bind in order, so one list serves both.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

enum class Dialect {
  kSqlite,
  kPostgres,
};

} // namespace draftstore::db::sql
