#include "pg_repository.hpp"

#include <string>
#include <string_view>
#include <variant>

#include "internal/db/sql/draft_filter_sql.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/util/time.hpp"

namespace draftstore::db::postgres {

using draftstore::v1::ResourceType;

namespace {

namespace dm = draftstore::model;

// 23505 on a primary key is a duplicate identity; on any other unique
// index it is a rule violation (e.g. second draft modification).
Result Translate(const std::exception& e) {
  if (const auto* u = dynamic_cast<const pqxx::unique_violation*>(&e)) {
    if (std::string_view(u->what()).find("_pkey") != std::string_view::npos) {
      return Result::Err(ErrorCode::AlreadyExists, e.what());
    }
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

template <typename Fn>
Result Guard(Fn&& fn) {
  try {
    fn();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<int64_t> OptId(int64_t id) {
  if (id == 0) return std::nullopt;
  return id;
}

// An explicit id bypasses nextval; keep the sequence ahead of it.
void AdvanceSequence(pqxx::work& work, const std::string& table, const std::string& column) {
  work.exec("SELECT setval(pg_get_serial_sequence('" + table + "','" + column + "'), (SELECT MAX(" + column +
            ") FROM " + table + "));");
}

pqxx::params ToParams(const sql::Params& in) {
  pqxx::params out;
  for (const auto& p : in) {
    std::visit([&out](const auto& v) { out.append(v); }, p);
  }
  return out;
}

ResourceType AsResourceType(const pqxx::field& f) {
  return dm::ParseResourceTypeTag(f.c_str()).value_or(draftstore::v1::RESOURCE_TYPE_UNSPECIFIED);
}

std::optional<int64_t> AsOptId(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<int64_t>();
}

model::ResourceRecord ReadResource(const pqxx::row& row) {
  model::ResourceRecord r;
  r.resource_id        = row[0].as<int64_t>();
  r.group_id           = row[1].as<int64_t>();
  r.resource_type      = AsResourceType(row[2]);
  r.created_on_ms      = row[3].as<uint64_t>();
  r.latest_snapshot_id = AsOptId(row[4]);
  r.is_deleted         = row[5].as<bool>();
  r.is_readonly        = row[6].as<bool>();
  return r;
}

model::SnapshotRecord ReadSnapshot(const pqxx::row& row) {
  model::SnapshotRecord r;
  r.snapshot_id   = row[0].as<int64_t>();
  r.resource_id   = row[1].as<int64_t>();
  r.resource_type = AsResourceType(row[2]);
  r.user_id       = row[3].as<int64_t>();
  r.description   = row[4].c_str();
  r.data          = row[5].c_str();
  r.created_on_ms = row[6].as<uint64_t>();
  return r;
}

model::DraftRecord ReadDraft(const pqxx::row& row) {
  model::DraftRecord r;
  r.draft_id            = row[0].as<int64_t>();
  r.group_id            = row[1].as<int64_t>();
  r.resource_type       = AsResourceType(row[2]);
  r.user_id             = row[3].as<int64_t>();
  r.payload             = row[4].c_str();
  r.created_on_ms       = row[5].as<uint64_t>();
  r.last_modified_on_ms = row[6].as<uint64_t>();
  r.resource_id         = AsOptId(row[7]);
  r.base_resource_id    = AsOptId(row[8]);
  return r;
}

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Users / groups
// ------------------------------------------------------------------

Result PgRepository::InsertUser(Transaction& t, model::UserRecord& r) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO users(user_id,username,created_on_ms) "
        "VALUES(COALESCE($1,nextval(pg_get_serial_sequence('users','user_id'))),$2,$3) RETURNING user_id;",
        OptId(r.user_id), r.username, r.created_on_ms);
    if (r.user_id != 0) AdvanceSequence(TX(t).Work(), "users", "user_id");
    r.user_id    = res[0][0].as<int64_t>();
    r.is_deleted = false;
  });
}

std::optional<model::UserRecord> PgRepository::GetUser(Transaction& t, int64_t user_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT u.user_id,u.username,u.created_on_ms,"
      "EXISTS(SELECT 1 FROM user_locks l WHERE l.user_id=u.user_id AND l.lock_type='delete') "
      "FROM users u WHERE u.user_id=$1;",
      user_id);
  if (res.empty()) return std::nullopt;

  model::UserRecord r;
  r.user_id       = res[0][0].as<int64_t>();
  r.username      = res[0][1].c_str();
  r.created_on_ms = res[0][2].as<uint64_t>();
  r.is_deleted    = res[0][3].as<bool>();
  return r;
}

Result PgRepository::LockUser(Transaction& t, int64_t user_id) {
  if (!GetUser(t, user_id)) return Result::Err(ErrorCode::NotFound);
  return Guard([&] {
    TX(t).Work().exec_params(
        "INSERT INTO user_locks(user_id,lock_type,created_on_ms) VALUES($1,'delete',$2) ON CONFLICT DO NOTHING;",
        user_id, NowMs());
  });
}

Result PgRepository::InsertGroup(Transaction& t, model::GroupRecord& r) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO user_groups(group_id,name,creator_id,created_on_ms) "
        "VALUES(COALESCE($1,nextval(pg_get_serial_sequence('user_groups','group_id'))),$2,$3,$4) RETURNING group_id;",
        OptId(r.group_id), r.name, r.creator_id, r.created_on_ms);
    if (r.group_id != 0) AdvanceSequence(TX(t).Work(), "user_groups", "group_id");
    r.group_id   = res[0][0].as<int64_t>();
    r.is_deleted = false;
  });
}

std::optional<model::GroupRecord> PgRepository::GetGroup(Transaction& t, int64_t group_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT g.group_id,g.name,g.creator_id,g.created_on_ms,"
      "EXISTS(SELECT 1 FROM group_locks l WHERE l.group_id=g.group_id AND l.lock_type='delete') "
      "FROM user_groups g WHERE g.group_id=$1;",
      group_id);
  if (res.empty()) return std::nullopt;

  model::GroupRecord r;
  r.group_id      = res[0][0].as<int64_t>();
  r.name          = res[0][1].c_str();
  r.creator_id    = res[0][2].as<int64_t>();
  r.created_on_ms = res[0][3].as<uint64_t>();
  r.is_deleted    = res[0][4].as<bool>();
  return r;
}

Result PgRepository::LockGroup(Transaction& t, int64_t group_id) {
  if (!GetGroup(t, group_id)) return Result::Err(ErrorCode::NotFound);
  return Guard([&] {
    TX(t).Work().exec_params(
        "INSERT INTO group_locks(group_id,lock_type,created_on_ms) VALUES($1,'delete',$2) ON CONFLICT DO NOTHING;",
        group_id, NowMs());
  });
}

Result PgRepository::AddGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
  if (!GetGroup(t, group_id) || !GetUser(t, user_id)) return Result::Err(ErrorCode::NotFound);
  return Guard([&] {
    TX(t).Work().exec_params("INSERT INTO group_members(group_id,user_id) VALUES($1,$2);", group_id, user_id);
  });
}

Result PgRepository::RemoveGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
  bool removed = false;
  auto res     = Guard([&] {
    auto r  = TX(t).Work().exec_params("DELETE FROM group_members WHERE group_id=$1 AND user_id=$2;", group_id, user_id);
    removed = r.affected_rows() > 0;
  });
  if (res && !removed) return Result::Err(ErrorCode::NotFound);
  return res;
}

bool PgRepository::IsGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM group_members WHERE group_id=$1 AND user_id=$2;", group_id, user_id);
  return !res.empty();
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result PgRepository::InsertResource(Transaction& t, model::ResourceRecord& r) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO resources(resource_id,group_id,resource_type,created_on_ms,latest_snapshot_id) "
        "VALUES(COALESCE($1,nextval(pg_get_serial_sequence('resources','resource_id'))),$2,$3,$4,NULL) "
        "RETURNING resource_id;",
        OptId(r.resource_id), r.group_id, dm::ResourceTypeTag(r.resource_type), r.created_on_ms);
    if (r.resource_id != 0) AdvanceSequence(TX(t).Work(), "resources", "resource_id");
    r.resource_id = res[0][0].as<int64_t>();
    r.latest_snapshot_id.reset();
    r.is_deleted  = false;
    r.is_readonly = false;
  });
}

std::optional<model::ResourceRecord> PgRepository::GetResource(Transaction& t, int64_t resource_id) {
  auto res = TX(t).Work().exec_prepared("get_resource", resource_id);
  if (res.empty()) return std::nullopt;
  return ReadResource(res[0]);
}

Result PgRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
  if (!GetResource(t, r.resource_id)) return Result::Err(ErrorCode::NotFound, "unknown resource");
  return Guard([&] {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(
        "INSERT INTO resource_snapshots(resource_snapshot_id,resource_id,resource_type,user_id,description,data,created_on_ms) "
        "VALUES(COALESCE($1,nextval(pg_get_serial_sequence('resource_snapshots','resource_snapshot_id'))),$2,$3,$4,$5,$6::jsonb,$7) "
        "RETURNING resource_snapshot_id;",
        OptId(r.snapshot_id), r.resource_id, dm::ResourceTypeTag(r.resource_type), r.user_id, r.description, r.data,
        r.created_on_ms);
    if (r.snapshot_id != 0) AdvanceSequence(w, "resource_snapshots", "resource_snapshot_id");
    r.snapshot_id = res[0][0].as<int64_t>();
    w.exec_params("UPDATE resources SET latest_snapshot_id=$1 WHERE resource_id=$2;", r.snapshot_id, r.resource_id);
  });
}

std::optional<model::SnapshotRecord> PgRepository::GetSnapshot(Transaction& t, int64_t snapshot_id) {
  auto res = TX(t).Work().exec_prepared("get_snapshot", snapshot_id);
  if (res.empty()) return std::nullopt;
  return ReadSnapshot(res[0]);
}

std::vector<model::SnapshotRecord> PgRepository::ListSnapshots(Transaction& t, int64_t resource_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT resource_snapshot_id,resource_id,resource_type,user_id,description,data::text,created_on_ms "
      "FROM resource_snapshots WHERE resource_id=$1 ORDER BY resource_snapshot_id ASC;",
      resource_id);

  std::vector<model::SnapshotRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSnapshot(row));
  return out;
}

Result PgRepository::InsertLock(Transaction& t, const model::LockRecord& r) {
  if (!GetResource(t, r.resource_id)) return Result::Err(ErrorCode::NotFound, "unknown resource");
  return Guard([&] {
    TX(t).Work().exec_params("INSERT INTO resource_locks(resource_id,lock_type,created_on_ms) VALUES($1,$2,$3);",
                             r.resource_id, dm::LockTypeTag(r.lock_type), r.created_on_ms);
  });
}

std::vector<model::LockRecord> PgRepository::GetLocks(Transaction& t, int64_t resource_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT resource_id,lock_type,created_on_ms FROM resource_locks WHERE resource_id=$1 ORDER BY created_on_ms ASC;",
      resource_id);

  std::vector<model::LockRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::LockRecord r;
    r.resource_id   = row[0].as<int64_t>();
    r.lock_type     = dm::ParseLockTypeTag(row[1].c_str()).value_or(draftstore::v1::RESOURCE_LOCK_TYPE_UNSPECIFIED);
    r.created_on_ms = row[2].as<uint64_t>();
    out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Dependency rules / edges
// ------------------------------------------------------------------

Result PgRepository::InsertDependencyType(Transaction& t, const model::DependencyTypeRecord& r) {
  return Guard([&] {
    TX(t).Work().exec_params(
        "INSERT INTO resource_dependency_types(parent_resource_type,child_resource_type) VALUES($1,$2) "
        "ON CONFLICT DO NOTHING;",
        dm::ResourceTypeTag(r.parent_resource_type), dm::ResourceTypeTag(r.child_resource_type));
  });
}

std::vector<model::DependencyTypeRecord> PgRepository::ListDependencyTypes(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT parent_resource_type,child_resource_type FROM resource_dependency_types "
      "ORDER BY parent_resource_type,child_resource_type;");

  std::vector<model::DependencyTypeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({AsResourceType(row[0]), AsResourceType(row[1])});
  return out;
}

std::optional<ParentTypeCheck> PgRepository::CheckParentType(Transaction& t, int64_t parent_resource_id,
                                                             ResourceType child_type) {
  auto res = TX(t).Work().exec_prepared("check_parent_type", parent_resource_id, dm::ResourceTypeTag(child_type));
  if (res.empty()) return std::nullopt;

  ParentTypeCheck check;
  check.parent_type = AsResourceType(res[0][0]);
  check.is_deleted  = res[0][1].as<bool>();
  check.legal       = res[0][2].as<bool>();
  return check;
}

Result PgRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  if (!GetResource(t, r.parent_resource_id) || !GetResource(t, r.child_resource_id)) {
    return Result::Err(ErrorCode::NotFound, "unknown resource");
  }
  return Guard([&] {
    TX(t).Work().exec_params(
        "INSERT INTO resource_dependencies(parent_resource_id,child_resource_id,parent_resource_type,child_resource_type) "
        "VALUES($1,$2,$3,$4);",
        r.parent_resource_id, r.child_resource_id, dm::ResourceTypeTag(r.parent_resource_type),
        dm::ResourceTypeTag(r.child_resource_type));
  });
}

Result PgRepository::DeleteDependency(Transaction& t, int64_t parent_resource_id, int64_t child_resource_id) {
  bool removed = false;
  auto res     = Guard([&] {
    auto r  = TX(t).Work().exec_params(
        "DELETE FROM resource_dependencies WHERE parent_resource_id=$1 AND child_resource_id=$2;", parent_resource_id,
        child_resource_id);
    removed = r.affected_rows() > 0;
  });
  if (res && !removed) return Result::Err(ErrorCode::NotFound);
  return res;
}

std::vector<model::DependencyRecord> PgRepository::SelectDependencies(Transaction& t, const char* where_column,
                                                                      int64_t id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT parent_resource_id,child_resource_id,parent_resource_type,child_resource_type "
                  "FROM resource_dependencies WHERE ") +
          where_column + "=$1 ORDER BY parent_resource_id,child_resource_id;",
      id);

  std::vector<model::DependencyRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::DependencyRecord r;
    r.parent_resource_id   = row[0].as<int64_t>();
    r.child_resource_id    = row[1].as<int64_t>();
    r.parent_resource_type = AsResourceType(row[2]);
    r.child_resource_type  = AsResourceType(row[3]);
    out.push_back(r);
  }
  return out;
}

std::vector<model::DependencyRecord> PgRepository::GetChildren(Transaction& t, int64_t parent_resource_id) {
  return SelectDependencies(t, "parent_resource_id", parent_resource_id);
}

std::vector<model::DependencyRecord> PgRepository::GetParents(Transaction& t, int64_t child_resource_id) {
  return SelectDependencies(t, "child_resource_id", child_resource_id);
}

// ------------------------------------------------------------------
// Drafts
// ------------------------------------------------------------------

Result PgRepository::InsertDraft(Transaction& t, model::DraftRecord& r) {
  return Guard([&] {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO drafts(draft_id,group_id,resource_type,user_id,payload,created_on_ms,last_modified_on_ms) "
        "VALUES(COALESCE($1,nextval(pg_get_serial_sequence('drafts','draft_id'))),$2,$3,$4,$5::jsonb,$6,$7) "
        "RETURNING draft_id;",
        OptId(r.draft_id), r.group_id, dm::ResourceTypeTag(r.resource_type), r.user_id, r.payload, r.created_on_ms,
        r.last_modified_on_ms);
    if (r.draft_id != 0) AdvanceSequence(TX(t).Work(), "drafts", "draft_id");
    r.draft_id = res[0][0].as<int64_t>();
  });
}

std::optional<model::DraftRecord> PgRepository::GetDraft(Transaction& t, int64_t draft_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT " + sql::DraftSelectColumns(sql::Dialect::kPostgres) + " FROM drafts WHERE draft_id=$1;", draft_id);
  if (res.empty()) return std::nullopt;
  return ReadDraft(res[0]);
}

Result PgRepository::UpdateDraft(Transaction& t, const model::DraftRecord& r) {
  bool updated = false;
  auto res     = Guard([&] {
    auto q  = TX(t).Work().exec_params(
        "UPDATE drafts SET group_id=$1,resource_type=$2,user_id=$3,payload=$4::jsonb,last_modified_on_ms=$5 "
        "WHERE draft_id=$6;",
        r.group_id, dm::ResourceTypeTag(r.resource_type), r.user_id, r.payload, r.last_modified_on_ms, r.draft_id);
    updated = q.affected_rows() > 0;
  });
  if (res && !updated) return Result::Err(ErrorCode::NotFound);
  return res;
}

Result PgRepository::DeleteDraft(Transaction& t, int64_t draft_id) {
  bool removed = false;
  auto res     = Guard([&] {
    auto q  = TX(t).Work().exec_prepared("delete_draft", draft_id);
    removed = q.affected_rows() > 0;
  });
  if (res && !removed) return Result::Err(ErrorCode::NotFound);
  return res;
}

std::vector<model::DraftRecord> PgRepository::FindDrafts(Transaction& t, const DraftFilter& filter,
                                                         const Pagination& page) {
  auto where = sql::BuildDraftWhere(filter, sql::Dialect::kPostgres);

  std::string q = "SELECT " + sql::DraftSelectColumns(sql::Dialect::kPostgres) + " FROM drafts" + where.sql +
                  " ORDER BY draft_id ASC";
  where.params.emplace_back(static_cast<int64_t>(page.offset));
  q += " OFFSET " + sql::Placeholder(sql::Dialect::kPostgres, where.params.size());
  if (page.limit != 0) {
    where.params.emplace_back(static_cast<int64_t>(page.limit));
    q += " LIMIT " + sql::Placeholder(sql::Dialect::kPostgres, where.params.size());
  }
  q += ";";

  auto res = TX(t).Work().exec_params(q, ToParams(where.params));

  std::vector<model::DraftRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDraft(row));
  return out;
}

uint64_t PgRepository::CountDrafts(Transaction& t, const DraftFilter& filter) {
  auto where = sql::BuildDraftWhere(filter, sql::Dialect::kPostgres);
  auto res   = TX(t).Work().exec_params("SELECT COUNT(*) FROM drafts" + where.sql + ";", ToParams(where.params));
  return res[0][0].as<uint64_t>();
}

std::vector<int64_t> PgRepository::ResourcesWithDraftModifications(Transaction& t,
                                                                   const std::vector<int64_t>& resource_ids,
                                                                   std::optional<int64_t> user_id) {
  if (resource_ids.empty()) return {};

  const auto  rid = sql::PayloadIdExpr(sql::Dialect::kPostgres, "resource_id");
  // One array literal keeps long id lists under the protocol's parameter limit.
  std::string ids = "{";
  for (std::size_t i = 0; i < resource_ids.size(); ++i) {
    if (i != 0) ids += ',';
    ids += std::to_string(resource_ids[i]);
  }
  ids += '}';

  sql::Params params;
  params.emplace_back(ids);
  std::string q = "SELECT DISTINCT " + rid + " FROM drafts WHERE " + rid + " = ANY($1::bigint[])";
  if (user_id) {
    params.emplace_back(*user_id);
    q += " AND user_id=" + sql::Placeholder(sql::Dialect::kPostgres, params.size());
  }
  q += " ORDER BY 1;";

  auto res = TX(t).Work().exec_params(q, ToParams(params));

  std::vector<int64_t> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(row[0].as<int64_t>());
  return out;
}

} // namespace draftstore::db::postgres
