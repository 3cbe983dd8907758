#include "pg_pool.hpp"

#include "internal/db/sql/migrations.hpp"

namespace orchestrator::db::postgres {

namespace {

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  int64_t QueryInt(const std::string& sql) override {
    return tx_.exec(sql)[0][0].as<int64_t>();
  }

 private:
  pqxx::work& tx_;
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      live_(0) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_;
    cv_.notify_one();
    throw;
  }
}

int PgPool::Bootstrap() {
  // Statements are prepared on connect, so the tables must exist first:
  // run the schema on a dedicated connection that never enters the pool.
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  // Serializes concurrent orchestrators starting against one database.
  tx.exec("SELECT pg_advisory_xact_lock(724311);");
  PgMigrationExecutor executor(tx);
  const int           applied = sql::RunMigrations(executor, sql::PostgresMigrations());
  tx.commit();
  return applied;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kBackendColumns =
      "id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause";

  conn.prepare("insert_backend",
               "INSERT INTO backends(id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("get_backend", std::string("SELECT ") + kBackendColumns + " FROM backends WHERE id=$1");

  conn.prepare("get_live_backend_by_key",
               std::string("SELECT ") + kBackendColumns + " FROM backends WHERE key=$1 AND state IN (1,2,3,4)");

  conn.prepare("list_backends", std::string("SELECT ") + kBackendColumns + " FROM backends ORDER BY id");

  conn.prepare("list_live_backends",
               std::string("SELECT ") + kBackendColumns + " FROM backends WHERE state IN (1,2,3,4) ORDER BY id");

  conn.prepare("list_backends_by_worker",
               std::string("SELECT ") + kBackendColumns + " FROM backends WHERE worker_id=$1 ORDER BY id");

  conn.prepare("update_backend_if_version",
               "UPDATE backends SET state=$2,address=$3,version=$4,last_state_change_at_ms=$5,cause=$6 "
               "WHERE id=$1 AND version=$7");

  conn.prepare("purge_terminal_backends",
               "DELETE FROM backends WHERE state IN (5,6,7) AND last_state_change_at_ms<$1 RETURNING id");

  conn.prepare("delete_transitions_for", "DELETE FROM transition_log WHERE backend_id=$1");

  conn.prepare("upsert_worker",
               "INSERT INTO workers(id,status,address,epoch,capacity_hint,last_heartbeat_at_ms,version) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) "
               "ON CONFLICT(id) DO UPDATE SET status=EXCLUDED.status,address=EXCLUDED.address,"
               "epoch=EXCLUDED.epoch,capacity_hint=EXCLUDED.capacity_hint,"
               "last_heartbeat_at_ms=EXCLUDED.last_heartbeat_at_ms,version=EXCLUDED.version");

  conn.prepare("get_worker",
               "SELECT id,status,address,epoch,capacity_hint,last_heartbeat_at_ms,version FROM workers WHERE id=$1");

  conn.prepare("list_workers",
               "SELECT id,status,address,epoch,capacity_hint,last_heartbeat_at_ms,version FROM workers ORDER BY id");

  conn.prepare("upsert_lease",
               "INSERT INTO leases(backend_id,worker_id,worker_epoch,expires_at_ms,active) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(backend_id) DO UPDATE SET worker_id=EXCLUDED.worker_id,"
               "worker_epoch=EXCLUDED.worker_epoch,expires_at_ms=EXCLUDED.expires_at_ms,active=EXCLUDED.active");

  conn.prepare("get_lease",
               "SELECT backend_id,worker_id,worker_epoch,expires_at_ms,active FROM leases WHERE backend_id=$1");

  conn.prepare("renew_leases",
               "UPDATE leases SET expires_at_ms=GREATEST(expires_at_ms,$3) "
               "WHERE worker_id=$1 AND worker_epoch=$2 AND active");

  conn.prepare("list_expired_leases",
               "SELECT backend_id,worker_id,worker_epoch,expires_at_ms,active FROM leases "
               "WHERE active AND expires_at_ms<=$1 ORDER BY expires_at_ms");

  conn.prepare("append_transition",
               "INSERT INTO transition_log(backend_id,from_state,to_state,version,at_ms,cause) "
               "VALUES($1,$2,$3,$4,$5,$6) RETURNING sequence");

  conn.prepare("get_transitions",
               "SELECT sequence,backend_id,from_state,to_state,version,at_ms,cause FROM transition_log "
               "WHERE backend_id=$1 ORDER BY version, sequence");
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

} // namespace orchestrator::db::postgres
