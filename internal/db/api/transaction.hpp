#pragma once

namespace orchestrator::db {

/*
  Unit of work for one state-store operation.

  A reservation (backend row + lease + first log entry) or an applied
  transition (CAS on the row + log entry + lease update) is written inside
  one Transaction, so the transition log never disagrees with the row.

  Every backend guarantees:
    - writes are invisible to other transactions until Commit()
    - Rollback(), or destruction without Commit(), discards all writes
    - two transactions that read-then-write the same backend never both
      commit; the loser fails with Conflict or db::TransientError

  SQLite: BEGIN IMMEDIATE on a single connection
  Postgres: SERIALIZABLE pqxx transaction per pooled connection
  Memory: exclusive lock over a copy-on-write snapshot
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  // May throw db::TransientError; the caller retries the whole operation.
  virtual void Commit() = 0;

  // No-op once the transaction has finished.
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
