#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"

namespace orchestrator::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int64_t QueryInt(const std::string& sql) override {
    sqlite3_stmt* st = nullptr;
    ThrowIf(sqlite3_prepare_v2(db_.Handle(), sql.c_str(), -1, &st, nullptr), db_.Handle(), "prepare");
    const int     rc    = sqlite3_step(st);
    const int64_t value = rc == SQLITE_ROW ? sqlite3_column_int64(st, 0) : 0;
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("query: ") + sqlite3_errmsg(db_.Handle()));
    }
    return value;
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) throw db::TransientError(msg);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::Bootstrap() {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  // IMMEDIATE: a second process opening the same file waits instead of
  // racing the version check.
  Exec("BEGIN IMMEDIATE;");
  try {
    SqliteMigrationExecutor executor(*this);
    const int               applied = sql::RunMigrations(executor, sql::SqliteMigrations());
    Exec("COMMIT;");
    return applied;
  } catch (const std::exception&) {
    Exec("ROLLBACK;");
    throw;
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers proceed while a writer holds the lock
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace orchestrator::db::sqlite
