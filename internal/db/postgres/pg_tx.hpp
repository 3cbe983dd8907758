#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace orchestrator::db::postgres {

/*
  One state-store operation on a pooled connection, at SERIALIZABLE.

  Two Reserve calls for the same key, or two ApplyEvent calls for the same
  backend, either serialize or one of them fails with a serialization
  error that surfaces as db::TransientError and is retried by the store.
*/
class PgTransaction final : public db::Transaction {
 public:
  using Work = pqxx::transaction<pqxx::isolation_level::serializable>;

  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  Work& W() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  // Declared before work_ so the connection outlives the transaction.
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<Work>             work_;
  State                             state_ = State::kOpen;
};

} // namespace orchestrator::db::postgres
