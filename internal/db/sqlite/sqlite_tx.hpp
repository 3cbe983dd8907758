#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace orchestrator::db::sqlite {

/*
  One state-store operation on the shared connection.

  BEGIN IMMEDIATE takes the write lock up front, so a Reserve or an
  ApplyEvent cannot read a backend row that another writer is about to
  change. The connection mutex is held from construction until
  Commit()/Rollback() (or the destructor).
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  // Throws db::TransientError when the commit hit a busy database.
  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  State state_ = State::kOpen;
};

}
