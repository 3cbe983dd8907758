#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/db/api/result.hpp"

namespace orchestrator::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<Work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  // pqxx aborts an open transaction in its destructor without throwing;
  // work_ goes first, then the connection returns to the pool.
  work_.reset();
}

void PgTransaction::Commit() {
  if (state_ != State::kOpen) {
    throw std::logic_error("postgres transaction: commit after finish");
  }
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    state_ = State::kRolledBack;
    throw db::TransientError(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    state_ = State::kRolledBack;
    throw db::TransientError(e.what());
  }
  state_ = State::kCommitted;
}

void PgTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  work_->abort();
}

} // namespace orchestrator::db::postgres
