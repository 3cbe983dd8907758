#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace orchestrator::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction. A connection can only carry
  one transaction at a time, so transactions take TxMutex() for their whole
  lifetime.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, migrations, transaction control)
  void Exec(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Brings the schema up to date; returns the number of migrations applied.
  int Bootstrap();

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace orchestrator::db::sqlite
