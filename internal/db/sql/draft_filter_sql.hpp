#pragma once

#include <string>

#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace draftstore::db::sql {

/*
  Draft queries shared by the SQL backends.

  The payload column holds the JSON blob; resource_id and
  base_resource_id are read out of it (json_extract on SQLite, ->> on
  Postgres). A JSON null extracts as SQL NULL on both.
*/

struct Clause {
  std::string sql; // empty or " WHERE ..."
  Params      params;
};

std::string Placeholder(Dialect dialect, std::size_t index); // 1-based

std::string PayloadIdExpr(Dialect dialect, const char* key);

Clause BuildDraftWhere(const DraftFilter& filter, Dialect dialect);

// Columns: draft_id, group_id, resource_type, user_id, payload,
// created_on_ms, last_modified_on_ms, resource_id, base_resource_id
std::string DraftSelectColumns(Dialect dialect);

} // namespace draftstore::db::sql
