#include "draft_filter_sql.hpp"

#include <vector>

#include "internal/model/resource_type.hpp"

namespace draftstore::db::sql {

std::string Placeholder(Dialect dialect, std::size_t index) {
  if (dialect == Dialect::kPostgres) return "$" + std::to_string(index);
  return "?";
}

std::string PayloadIdExpr(Dialect dialect, const char* key) {
  if (dialect == Dialect::kPostgres) return std::string("(payload->>'") + key + "')::bigint";
  return std::string("json_extract(payload,'$.") + key + "')";
}

Clause BuildDraftWhere(const DraftFilter& filter, Dialect dialect) {
  Clause                   out;
  std::vector<std::string> terms;

  const auto resource_id = PayloadIdExpr(dialect, "resource_id");

  auto bind = [&](const std::string& lhs, const char* op, Param value) {
    out.params.push_back(std::move(value));
    terms.push_back(lhs + op + Placeholder(dialect, out.params.size()));
  };

  switch (filter.draft_type) {
    case DraftType::kResource:
      terms.push_back(resource_id + " IS NULL");
      break;
    case DraftType::kModification:
      terms.push_back(resource_id + " IS NOT NULL");
      break;
    case DraftType::kAny:
      break;
  }

  if (filter.resource_type) bind("resource_type", "=", draftstore::model::ResourceTypeTag(*filter.resource_type));
  if (filter.user_id) bind("user_id", "=", *filter.user_id);
  if (filter.exclude_user_id) bind("user_id", "<>", *filter.exclude_user_id);
  if (filter.group_id) bind("group_id", "=", *filter.group_id);
  if (filter.resource_id) bind(resource_id, "=", *filter.resource_id);
  if (filter.base_resource_id) bind(PayloadIdExpr(dialect, "base_resource_id"), "=", *filter.base_resource_id);

  for (std::size_t i = 0; i < terms.size(); ++i) {
    out.sql += (i == 0 ? " WHERE " : " AND ") + terms[i];
  }
  return out;
}

std::string DraftSelectColumns(Dialect dialect) {
  const std::string payload = dialect == Dialect::kPostgres ? "payload::text" : "payload";
  return "draft_id,group_id,resource_type,user_id," + payload + ",created_on_ms,last_modified_on_ms," +
         PayloadIdExpr(dialect, "resource_id") + "," + PayloadIdExpr(dialect, "base_resource_id");
}

} // namespace draftstore::db::sql
