#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/backend_record.hpp"
#include "internal/db/model/lease_record.hpp"
#include "internal/db/model/transition_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace orchestrator::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateBackendIfVersion is a compare-and-set on the row version
  - InsertBackend rejects a second live backend for the same key
  - Transition log rows are append-only

  The DB is the source of truth for:
    backend lifecycle state
    worker membership and epochs
    leases
    the transition log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Backends
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is taken, ConstraintViolation when a live
  // backend already holds the key.
  virtual Result InsertBackend(Transaction&, const model::BackendRecord&) = 0;

  virtual std::optional<model::BackendRecord> GetBackend(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::BackendRecord> GetLiveBackendByKey(Transaction&, const std::string& key) = 0;

  virtual std::vector<model::BackendRecord> ListBackends(Transaction&) = 0;

  virtual std::vector<model::BackendRecord> ListLiveBackends(Transaction&) = 0;

  virtual std::vector<model::BackendRecord> ListBackendsByWorker(Transaction&, const std::string& worker_id) = 0;

  // Writes the record only if the stored version equals expected_version.
  // Conflict on mismatch, NotFound if the row does not exist.
  virtual Result UpdateBackendIfVersion(Transaction&, const model::BackendRecord&, uint64_t expected_version) = 0;

  // Removes terminal backends (with their lease and log rows) whose last
  // transition happened before cutoff_ms.
  virtual Result PurgeTerminalBackends(Transaction&, uint64_t cutoff_ms, uint64_t& purged) = 0;

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  virtual Result UpsertWorker(Transaction&, const model::WorkerRecord&) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::WorkerRecord> ListWorkers(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Leases
  // ---------------------------------------------------------------------

  virtual Result UpsertLease(Transaction&, const model::LeaseRecord&) = 0;

  virtual std::optional<model::LeaseRecord> GetLease(Transaction&, const std::string& backend_id) = 0;

  // Extends every active lease held by worker_id under `epoch`.
  virtual Result RenewLeases(Transaction&, const std::string& worker_id, uint64_t epoch, uint64_t expires_at_ms, uint64_t& renewed) = 0;

  virtual std::vector<model::LeaseRecord> ListExpiredLeases(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Transition log
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result AppendTransition(Transaction&, model::TransitionRecord&) = 0;

  // Entries for one backend ordered by version.
  virtual std::vector<model::TransitionRecord> GetTransitions(Transaction&, const std::string& backend_id) = 0;
};

} // namespace orchestrator::db
