#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace orchestrator::db::sql {

using observability::IntField;
using observability::StringField;

namespace {

// Portable across both dialects.
constexpr const char* kVersionTable =
    "CREATE TABLE IF NOT EXISTS schema_migrations (version BIGINT PRIMARY KEY, applied_at_ms BIGINT NOT NULL);";

} // namespace

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  executor.ExecuteSQL(kVersionTable);
  const int64_t current = executor.QueryInt("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");

  int applied = 0;
  for (const auto& migration : migrations) {
    if (migration.version <= current) continue;
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.ExecuteSQL("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(" +
                        std::to_string(migration.version) + ", " + std::to_string(util::NowMillis()) + ");");
    ORCHESTRATOR_LOG_INFO("schema migration applied",
                          {IntField("version", migration.version), StringField("description", migration.description)});
    ++applied;
  }
  return applied;
}

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "backends, workers and leases",
       {"CREATE TABLE IF NOT EXISTS backends (id TEXT PRIMARY KEY, key TEXT NOT NULL, state INTEGER NOT NULL, worker_id TEXT NOT NULL, address TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, last_state_change_at_ms INTEGER NOT NULL, cause TEXT NOT NULL DEFAULT '');",
        "CREATE UNIQUE INDEX IF NOT EXISTS backends_live_key ON backends(key) WHERE state IN (1,2,3,4);",
        "CREATE INDEX IF NOT EXISTS backends_worker ON backends(worker_id);",
        "CREATE TABLE IF NOT EXISTS workers (id TEXT PRIMARY KEY, status INTEGER NOT NULL, address TEXT NOT NULL, epoch INTEGER NOT NULL, capacity_hint INTEGER NOT NULL, last_heartbeat_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS leases (backend_id TEXT PRIMARY KEY REFERENCES backends(id) ON DELETE CASCADE, worker_id TEXT NOT NULL, worker_epoch INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, active INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS leases_expiry ON leases(active, expires_at_ms);",
        "CREATE INDEX IF NOT EXISTS leases_worker ON leases(worker_id, worker_epoch);"}},
      {2,
       "transition log",
       {"CREATE TABLE IF NOT EXISTS transition_log (sequence INTEGER PRIMARY KEY AUTOINCREMENT, backend_id TEXT NOT NULL, from_state INTEGER NOT NULL, to_state INTEGER NOT NULL, version INTEGER NOT NULL, at_ms INTEGER NOT NULL, cause TEXT NOT NULL);",
        "CREATE INDEX IF NOT EXISTS transition_log_backend ON transition_log(backend_id, version);"}}};
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "backends, workers and leases",
       {"CREATE TABLE IF NOT EXISTS backends (id TEXT PRIMARY KEY, key TEXT NOT NULL, state SMALLINT NOT NULL, worker_id TEXT NOT NULL, address TEXT NOT NULL DEFAULT '', version BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, last_state_change_at_ms BIGINT NOT NULL, cause TEXT NOT NULL DEFAULT '');",
        "CREATE UNIQUE INDEX IF NOT EXISTS backends_live_key ON backends(key) WHERE state IN (1,2,3,4);",
        "CREATE INDEX IF NOT EXISTS backends_worker ON backends(worker_id);",
        "CREATE TABLE IF NOT EXISTS workers (id TEXT PRIMARY KEY, status SMALLINT NOT NULL, address TEXT NOT NULL, epoch BIGINT NOT NULL, capacity_hint INTEGER NOT NULL, last_heartbeat_at_ms BIGINT NOT NULL, version BIGINT NOT NULL);",
        "CREATE TABLE IF NOT EXISTS leases (backend_id TEXT PRIMARY KEY REFERENCES backends(id) ON DELETE CASCADE, worker_id TEXT NOT NULL, worker_epoch BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, active BOOLEAN NOT NULL);",
        "CREATE INDEX IF NOT EXISTS leases_expiry ON leases(active, expires_at_ms);",
        "CREATE INDEX IF NOT EXISTS leases_worker ON leases(worker_id, worker_epoch);"}},
      {2,
       "transition log",
       {"CREATE TABLE IF NOT EXISTS transition_log (sequence BIGSERIAL PRIMARY KEY, backend_id TEXT NOT NULL, from_state SMALLINT NOT NULL, to_state SMALLINT NOT NULL, version BIGINT NOT NULL, at_ms BIGINT NOT NULL, cause TEXT NOT NULL);",
        "CREATE INDEX IF NOT EXISTS transition_log_backend ON transition_log(backend_id, version);"}}};
  return kMigrations;
}

} // namespace orchestrator::db::sql
