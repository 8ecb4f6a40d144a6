#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "internal/db/sql/draft_filter_sql.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/util/time.hpp"

namespace draftstore::db::sqlite {

using draftstore::db::ErrorCode;
using draftstore::db::Result;
using draftstore::v1::ResourceType;

namespace {

namespace dm = draftstore::model;

struct StmtDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Reads have no Result channel; a statement that fails to prepare is a bug
// or a broken schema, not a miss.
Stmt PrepareOrThrow(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Stmt(st);
}

Stmt Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Stmt();
    return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 = let sqlite assign the rowid
void BindId(sqlite3_stmt* st, int idx, int64_t id) {
    if (id == 0) {
        sqlite3_bind_null(st, idx);
    } else {
        BindI64(st, idx, id);
    }
}

void BindParams(sqlite3_stmt* st, const sql::Params& params, int first_idx = 1) {
    int idx = first_idx;
    for (const auto& p : params) {
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    sqlite3_bind_null(st, idx);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    BindText(st, idx, v);
                } else {
                    BindI64(st, idx, static_cast<int64_t>(v));
                }
            },
            p);
        ++idx;
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColI64(st, col);
}

ResourceType ColResourceType(sqlite3_stmt* st, int col) {
    return dm::ParseResourceTypeTag(ColText(st, col)).value_or(draftstore::v1::RESOURCE_TYPE_UNSPECIFIED);
}

model::ResourceRecord ReadResource(sqlite3_stmt* st) {
    model::ResourceRecord r;
    r.resource_id        = ColI64(st, 0);
    r.group_id           = ColI64(st, 1);
    r.resource_type      = ColResourceType(st, 2);
    r.created_on_ms      = static_cast<uint64_t>(ColI64(st, 3));
    r.latest_snapshot_id = ColOptI64(st, 4);
    r.is_deleted         = ColI64(st, 5) != 0;
    r.is_readonly        = ColI64(st, 6) != 0;
    return r;
}

model::SnapshotRecord ReadSnapshot(sqlite3_stmt* st) {
    model::SnapshotRecord r;
    r.snapshot_id   = ColI64(st, 0);
    r.resource_id   = ColI64(st, 1);
    r.resource_type = ColResourceType(st, 2);
    r.user_id       = ColI64(st, 3);
    r.description   = ColText(st, 4);
    r.data          = ColText(st, 5);
    r.created_on_ms = static_cast<uint64_t>(ColI64(st, 6));
    return r;
}

model::DraftRecord ReadDraft(sqlite3_stmt* st) {
    model::DraftRecord r;
    r.draft_id            = ColI64(st, 0);
    r.group_id            = ColI64(st, 1);
    r.resource_type       = ColResourceType(st, 2);
    r.user_id             = ColI64(st, 3);
    r.payload             = ColText(st, 4);
    r.created_on_ms       = static_cast<uint64_t>(ColI64(st, 5));
    r.last_modified_on_ms = static_cast<uint64_t>(ColI64(st, 6));
    r.resource_id         = ColOptI64(st, 7);
    r.base_resource_id    = ColOptI64(st, 8);
    return r;
}

constexpr const char* kSelectResource =
    "SELECT r.resource_id,r.group_id,r.resource_type,r.created_on_ms,r.latest_snapshot_id,"
    "EXISTS(SELECT 1 FROM resource_locks l WHERE l.resource_id=r.resource_id AND l.lock_type='delete'),"
    "EXISTS(SELECT 1 FROM resource_locks l WHERE l.resource_id=r.resource_id AND l.lock_type='readonly') "
    "FROM resources r WHERE r.resource_id=?;";

constexpr const char* kSnapshotColumns =
    "resource_snapshot_id,resource_id,resource_type,user_id,description,data,created_on_ms";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Users / groups
// ------------------------------------------------------------------

Result SqliteRepository::InsertUser(Transaction& t, model::UserRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO users(user_id,username,created_on_ms) VALUES(?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindId(st.get(), 1, r.user_id);
    BindText(st.get(), 2, r.username);
    BindI64(st.get(), 3, static_cast<int64_t>(r.created_on_ms));

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && r.user_id == 0) r.user_id = sqlite3_last_insert_rowid(db);
    r.is_deleted = false;
    return res;
}

std::optional<model::UserRecord> SqliteRepository::GetUser(Transaction& t, int64_t user_id) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        "SELECT u.user_id,u.username,u.created_on_ms,"
        "EXISTS(SELECT 1 FROM user_locks l WHERE l.user_id=u.user_id AND l.lock_type='delete') "
        "FROM users u WHERE u.user_id=?;");
    BindI64(st.get(), 1, user_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::UserRecord r;
    r.user_id       = ColI64(st.get(), 0);
    r.username      = ColText(st.get(), 1);
    r.created_on_ms = static_cast<uint64_t>(ColI64(st.get(), 2));
    r.is_deleted    = ColI64(st.get(), 3) != 0;
    return r;
}

Result SqliteRepository::LockUser(Transaction& t, int64_t user_id) {
    if (!GetUser(t, user_id)) return Result::Err(ErrorCode::NotFound);

    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "INSERT OR IGNORE INTO user_locks(user_id,lock_type,created_on_ms) VALUES(?,'delete',?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, user_id);
    BindI64(st.get(), 2, static_cast<int64_t>(util::ToUnixMillis(util::Now())));
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertGroup(Transaction& t, model::GroupRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO user_groups(group_id,name,creator_id,created_on_ms) VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindId(st.get(), 1, r.group_id);
    BindText(st.get(), 2, r.name);
    BindI64(st.get(), 3, r.creator_id);
    BindI64(st.get(), 4, static_cast<int64_t>(r.created_on_ms));

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && r.group_id == 0) r.group_id = sqlite3_last_insert_rowid(db);
    r.is_deleted = false;
    return res;
}

std::optional<model::GroupRecord> SqliteRepository::GetGroup(Transaction& t, int64_t group_id) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        "SELECT g.group_id,g.name,g.creator_id,g.created_on_ms,"
        "EXISTS(SELECT 1 FROM group_locks l WHERE l.group_id=g.group_id AND l.lock_type='delete') "
        "FROM user_groups g WHERE g.group_id=?;");
    BindI64(st.get(), 1, group_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::GroupRecord r;
    r.group_id      = ColI64(st.get(), 0);
    r.name          = ColText(st.get(), 1);
    r.creator_id    = ColI64(st.get(), 2);
    r.created_on_ms = static_cast<uint64_t>(ColI64(st.get(), 3));
    r.is_deleted    = ColI64(st.get(), 4) != 0;
    return r;
}

Result SqliteRepository::LockGroup(Transaction& t, int64_t group_id) {
    if (!GetGroup(t, group_id)) return Result::Err(ErrorCode::NotFound);

    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "INSERT OR IGNORE INTO group_locks(group_id,lock_type,created_on_ms) VALUES(?,'delete',?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, group_id);
    BindI64(st.get(), 2, static_cast<int64_t>(util::ToUnixMillis(util::Now())));
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::AddGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
    if (!GetGroup(t, group_id) || !GetUser(t, user_id)) return Result::Err(ErrorCode::NotFound);

    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "INSERT INTO group_members(group_id,user_id) VALUES(?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, group_id);
    BindI64(st.get(), 2, user_id);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::RemoveGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "DELETE FROM group_members WHERE group_id=? AND user_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, group_id);
    BindI64(st.get(), 2, user_id);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return res;
}

bool SqliteRepository::IsGroupMember(Transaction& t, int64_t group_id, int64_t user_id) {
    auto st = PrepareOrThrow(TX(t).Handle(), "SELECT 1 FROM group_members WHERE group_id=? AND user_id=?;");
    BindI64(st.get(), 1, group_id);
    BindI64(st.get(), 2, user_id);
    return sqlite3_step(st.get()) == SQLITE_ROW;
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result SqliteRepository::InsertResource(Transaction& t, model::ResourceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO resources(resource_id,group_id,resource_type,created_on_ms,latest_snapshot_id) "
        "VALUES(?,?,?,?,NULL);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindId(st.get(), 1, r.resource_id);
    BindI64(st.get(), 2, r.group_id);
    BindText(st.get(), 3, dm::ResourceTypeTag(r.resource_type));
    BindI64(st.get(), 4, static_cast<int64_t>(r.created_on_ms));

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && r.resource_id == 0) r.resource_id = sqlite3_last_insert_rowid(db);
    r.latest_snapshot_id.reset();
    r.is_deleted  = false;
    r.is_readonly = false;
    return res;
}

std::optional<model::ResourceRecord> SqliteRepository::GetResource(Transaction& t, int64_t resource_id) {
    auto st = PrepareOrThrow(TX(t).Handle(), kSelectResource);
    BindI64(st.get(), 1, resource_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadResource(st.get());
}

Result SqliteRepository::InsertSnapshot(Transaction& t, model::SnapshotRecord& r) {
    if (!GetResource(t, r.resource_id)) return Result::Err(ErrorCode::NotFound, "unknown resource");

    auto* db = TX(t).Handle();
    {
        auto st = Prepare(db,
            "INSERT INTO resource_snapshots(resource_snapshot_id,resource_id,resource_type,user_id,description,data,created_on_ms) "
            "VALUES(?,?,?,?,?,?,?);");
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindId(st.get(), 1, r.snapshot_id);
        BindI64(st.get(), 2, r.resource_id);
        BindText(st.get(), 3, dm::ResourceTypeTag(r.resource_type));
        BindI64(st.get(), 4, r.user_id);
        BindText(st.get(), 5, r.description);
        BindText(st.get(), 6, r.data);
        BindI64(st.get(), 7, static_cast<int64_t>(r.created_on_ms));

        auto res = Translate(db, sqlite3_step(st.get()));
        if (!res) return res;
        if (r.snapshot_id == 0) r.snapshot_id = sqlite3_last_insert_rowid(db);
    }

    auto st = Prepare(db, "UPDATE resources SET latest_snapshot_id=? WHERE resource_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindI64(st.get(), 1, r.snapshot_id);
    BindI64(st.get(), 2, r.resource_id);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SnapshotRecord> SqliteRepository::GetSnapshot(Transaction& t, int64_t snapshot_id) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        std::string("SELECT ") + kSnapshotColumns + " FROM resource_snapshots WHERE resource_snapshot_id=?;");
    BindI64(st.get(), 1, snapshot_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadSnapshot(st.get());
}

std::vector<model::SnapshotRecord> SqliteRepository::ListSnapshots(Transaction& t, int64_t resource_id) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        std::string("SELECT ") + kSnapshotColumns +
        " FROM resource_snapshots WHERE resource_id=? ORDER BY resource_snapshot_id ASC;");
    BindI64(st.get(), 1, resource_id);

    std::vector<model::SnapshotRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadSnapshot(st.get()));
    return out;
}

Result SqliteRepository::InsertLock(Transaction& t, const model::LockRecord& r) {
    if (!GetResource(t, r.resource_id)) return Result::Err(ErrorCode::NotFound, "unknown resource");

    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "INSERT INTO resource_locks(resource_id,lock_type,created_on_ms) VALUES(?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.resource_id);
    BindText(st.get(), 2, dm::LockTypeTag(r.lock_type));
    BindI64(st.get(), 3, static_cast<int64_t>(r.created_on_ms));
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::LockRecord> SqliteRepository::GetLocks(Transaction& t, int64_t resource_id) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        "SELECT resource_id,lock_type,created_on_ms FROM resource_locks WHERE resource_id=? ORDER BY created_on_ms ASC;");
    BindI64(st.get(), 1, resource_id);

    std::vector<model::LockRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::LockRecord r;
        r.resource_id   = ColI64(st.get(), 0);
        r.lock_type     = dm::ParseLockTypeTag(ColText(st.get(), 1)).value_or(draftstore::v1::RESOURCE_LOCK_TYPE_UNSPECIFIED);
        r.created_on_ms = static_cast<uint64_t>(ColI64(st.get(), 2));
        out.push_back(r);
    }
    return out;
}

// ------------------------------------------------------------------
// Dependency rules / edges
// ------------------------------------------------------------------

Result SqliteRepository::InsertDependencyType(Transaction& t, const model::DependencyTypeRecord& r) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT OR IGNORE INTO resource_dependency_types(parent_resource_type,child_resource_type) VALUES(?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, dm::ResourceTypeTag(r.parent_resource_type));
    BindText(st.get(), 2, dm::ResourceTypeTag(r.child_resource_type));
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::DependencyTypeRecord> SqliteRepository::ListDependencyTypes(Transaction& t) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        "SELECT parent_resource_type,child_resource_type FROM resource_dependency_types "
        "ORDER BY parent_resource_type,child_resource_type;");

    std::vector<model::DependencyTypeRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back({ColResourceType(st.get(), 0), ColResourceType(st.get(), 1)});
    }
    return out;
}

std::optional<ParentTypeCheck> SqliteRepository::CheckParentType(Transaction& t, int64_t parent_resource_id,
                                                                 ResourceType child_type) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        "SELECT r.resource_type,"
        "EXISTS(SELECT 1 FROM resource_locks l WHERE l.resource_id=r.resource_id AND l.lock_type='delete'),"
        "EXISTS(SELECT 1 FROM resource_dependency_types d "
        "WHERE d.parent_resource_type=r.resource_type AND d.child_resource_type=?) "
        "FROM resources r WHERE r.resource_id=?;");
    BindText(st.get(), 1, dm::ResourceTypeTag(child_type));
    BindI64(st.get(), 2, parent_resource_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    ParentTypeCheck check;
    check.parent_type = ColResourceType(st.get(), 0);
    check.is_deleted  = ColI64(st.get(), 1) != 0;
    check.legal       = ColI64(st.get(), 2) != 0;
    return check;
}

Result SqliteRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
    if (!GetResource(t, r.parent_resource_id) || !GetResource(t, r.child_resource_id)) {
        return Result::Err(ErrorCode::NotFound, "unknown resource");
    }

    auto* db = TX(t).Handle();
    auto  st = Prepare(db,
        "INSERT INTO resource_dependencies(parent_resource_id,child_resource_id,parent_resource_type,child_resource_type) "
        "VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.parent_resource_id);
    BindI64(st.get(), 2, r.child_resource_id);
    BindText(st.get(), 3, dm::ResourceTypeTag(r.parent_resource_type));
    BindText(st.get(), 4, dm::ResourceTypeTag(r.child_resource_type));
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteDependency(Transaction& t, int64_t parent_resource_id, int64_t child_resource_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "DELETE FROM resource_dependencies WHERE parent_resource_id=? AND child_resource_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, parent_resource_id);
    BindI64(st.get(), 2, child_resource_id);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return res;
}

std::vector<model::DependencyRecord> SqliteRepository::SelectDependencies(Transaction& t, const char* where_column,
                                                                          int64_t id) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        std::string("SELECT parent_resource_id,child_resource_id,parent_resource_type,child_resource_type "
                    "FROM resource_dependencies WHERE ") +
        where_column + "=? ORDER BY parent_resource_id,child_resource_id;");
    BindI64(st.get(), 1, id);

    std::vector<model::DependencyRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        model::DependencyRecord r;
        r.parent_resource_id   = ColI64(st.get(), 0);
        r.child_resource_id    = ColI64(st.get(), 1);
        r.parent_resource_type = ColResourceType(st.get(), 2);
        r.child_resource_type  = ColResourceType(st.get(), 3);
        out.push_back(r);
    }
    return out;
}

std::vector<model::DependencyRecord> SqliteRepository::GetChildren(Transaction& t, int64_t parent_resource_id) {
    return SelectDependencies(t, "parent_resource_id", parent_resource_id);
}

std::vector<model::DependencyRecord> SqliteRepository::GetParents(Transaction& t, int64_t child_resource_id) {
    return SelectDependencies(t, "child_resource_id", child_resource_id);
}

// ------------------------------------------------------------------
// Drafts
// ------------------------------------------------------------------

Result SqliteRepository::InsertDraft(Transaction& t, model::DraftRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO drafts(draft_id,group_id,resource_type,user_id,payload,created_on_ms,last_modified_on_ms) "
        "VALUES(?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindId(st.get(), 1, r.draft_id);
    BindI64(st.get(), 2, r.group_id);
    BindText(st.get(), 3, dm::ResourceTypeTag(r.resource_type));
    BindI64(st.get(), 4, r.user_id);
    BindText(st.get(), 5, r.payload);
    BindI64(st.get(), 6, static_cast<int64_t>(r.created_on_ms));
    BindI64(st.get(), 7, static_cast<int64_t>(r.last_modified_on_ms));

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && r.draft_id == 0) r.draft_id = sqlite3_last_insert_rowid(db);
    return res;
}

std::optional<model::DraftRecord> SqliteRepository::GetDraft(Transaction& t, int64_t draft_id) {
    auto st = PrepareOrThrow(TX(t).Handle(),
        "SELECT " + sql::DraftSelectColumns(sql::Dialect::kSqlite) + " FROM drafts WHERE draft_id=?;");
    BindI64(st.get(), 1, draft_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadDraft(st.get());
}

Result SqliteRepository::UpdateDraft(Transaction& t, const model::DraftRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE drafts SET group_id=?,resource_type=?,user_id=?,payload=?,last_modified_on_ms=? WHERE draft_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, r.group_id);
    BindText(st.get(), 2, dm::ResourceTypeTag(r.resource_type));
    BindI64(st.get(), 3, r.user_id);
    BindText(st.get(), 4, r.payload);
    BindI64(st.get(), 5, static_cast<int64_t>(r.last_modified_on_ms));
    BindI64(st.get(), 6, r.draft_id);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return res;
}

Result SqliteRepository::DeleteDraft(Transaction& t, int64_t draft_id) {
    auto* db = TX(t).Handle();
    auto  st = Prepare(db, "DELETE FROM drafts WHERE draft_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, draft_id);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return res;
}

std::vector<model::DraftRecord> SqliteRepository::FindDrafts(Transaction& t, const DraftFilter& filter,
                                                             const Pagination& page) {
    auto where = sql::BuildDraftWhere(filter, sql::Dialect::kSqlite);

    // LIMIT -1 is unbounded in sqlite
    std::string q = "SELECT " + sql::DraftSelectColumns(sql::Dialect::kSqlite) + " FROM drafts" + where.sql +
                    " ORDER BY draft_id ASC LIMIT ? OFFSET ?;";
    where.params.emplace_back(page.limit == 0 ? int64_t{-1} : static_cast<int64_t>(page.limit));
    where.params.emplace_back(static_cast<int64_t>(page.offset));

    auto st = PrepareOrThrow(TX(t).Handle(), q);
    BindParams(st.get(), where.params);

    std::vector<model::DraftRecord> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadDraft(st.get()));
    return out;
}

uint64_t SqliteRepository::CountDrafts(Transaction& t, const DraftFilter& filter) {
    auto where = sql::BuildDraftWhere(filter, sql::Dialect::kSqlite);

    auto st = PrepareOrThrow(TX(t).Handle(), "SELECT COUNT(*) FROM drafts" + where.sql + ";");
    BindParams(st.get(), where.params);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(ColI64(st.get(), 0));
}

std::vector<int64_t> SqliteRepository::ResourcesWithDraftModifications(Transaction& t,
                                                                       const std::vector<int64_t>& resource_ids,
                                                                       std::optional<int64_t> user_id) {
    if (resource_ids.empty()) return {};

    // The id list travels as one JSON array so its length is not bound by SQLITE_MAX_VARIABLE_NUMBER.
    std::string ids = "[";
    for (std::size_t i = 0; i < resource_ids.size(); ++i) {
        if (i != 0) ids += ',';
        ids += std::to_string(resource_ids[i]);
    }
    ids += ']';

    const auto  rid = sql::PayloadIdExpr(sql::Dialect::kSqlite, "resource_id");
    std::string q   = "SELECT DISTINCT " + rid + " FROM drafts WHERE " + rid + " IN (SELECT value FROM json_each(?))";
    if (user_id) q += " AND user_id=?";
    q += " ORDER BY 1;";

    auto st = PrepareOrThrow(TX(t).Handle(), q);
    BindText(st.get(), 1, ids);
    if (user_id) BindI64(st.get(), 2, *user_id);

    std::vector<int64_t> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ColI64(st.get(), 0));
    return out;
}

} // namespace draftstore::db::sqlite
