#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace orchestrator::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;
  // Destructors must not throw: report the failed rollback and move on.
  int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    ORCHESTRATOR_LOG_WARN("sqlite rollback failed",
                          {observability::StringField("path", db_->Path()),
                           observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) throw std::logic_error("sqlite transaction already finished");
  try {
    db_->Exec("COMMIT;");
  } catch (const db::TransientError&) {
    // A failed COMMIT leaves the transaction open; undo it so the caller can retry.
    Rollback();
    throw;
  }
  state_ = State::kCommitted;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

}
