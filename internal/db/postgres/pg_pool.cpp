#include "pg_pool.hpp"

namespace draftstore::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::Bootstrap(const std::vector<std::string>& statements) {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const auto& sql : statements) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_resource",
               "SELECT r.resource_id,r.group_id,r.resource_type,r.created_on_ms,r.latest_snapshot_id,"
               "EXISTS(SELECT 1 FROM resource_locks l WHERE l.resource_id=r.resource_id AND l.lock_type='delete'),"
               "EXISTS(SELECT 1 FROM resource_locks l WHERE l.resource_id=r.resource_id AND l.lock_type='readonly') "
               "FROM resources r WHERE r.resource_id=$1");

  conn.prepare("check_parent_type",
               "SELECT r.resource_type,"
               "EXISTS(SELECT 1 FROM resource_locks l WHERE l.resource_id=r.resource_id AND l.lock_type='delete'),"
               "EXISTS(SELECT 1 FROM resource_dependency_types d "
               "WHERE d.parent_resource_type=r.resource_type AND d.child_resource_type=$2) "
               "FROM resources r WHERE r.resource_id=$1");

  conn.prepare("get_snapshot",
               "SELECT resource_snapshot_id,resource_id,resource_type,user_id,description,data::text,created_on_ms "
               "FROM resource_snapshots WHERE resource_snapshot_id=$1");

  conn.prepare("delete_draft", "DELETE FROM drafts WHERE draft_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace draftstore::db::postgres
