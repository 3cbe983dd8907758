#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace orchestrator::db::memory {

class MemoryTransaction;

/*
  In-process repository for tests and single-node development.

  Transactions are serialized by an exclusive lock held from Begin() until
  Commit()/Rollback(), which makes every transaction trivially serializable.
  Do not open a second transaction on the same thread while one is live.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBackend(Transaction&, const model::BackendRecord&) override;
  std::optional<model::BackendRecord> GetBackend(Transaction&, const std::string&) override;
  std::optional<model::BackendRecord> GetLiveBackendByKey(Transaction&, const std::string&) override;
  std::vector<model::BackendRecord> ListBackends(Transaction&) override;
  std::vector<model::BackendRecord> ListLiveBackends(Transaction&) override;
  std::vector<model::BackendRecord> ListBackendsByWorker(Transaction&, const std::string&) override;
  Result UpdateBackendIfVersion(Transaction&, const model::BackendRecord&, uint64_t expected_version) override;
  Result PurgeTerminalBackends(Transaction&, uint64_t cutoff_ms, uint64_t& purged) override;

  Result UpsertWorker(Transaction&, const model::WorkerRecord&) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string&) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&) override;

  Result UpsertLease(Transaction&, const model::LeaseRecord&) override;
  std::optional<model::LeaseRecord> GetLease(Transaction&, const std::string&) override;
  Result RenewLeases(Transaction&, const std::string& worker_id, uint64_t epoch, uint64_t expires_at_ms,
                     uint64_t& renewed) override;
  std::vector<model::LeaseRecord> ListExpiredLeases(Transaction&, uint64_t now_ms) override;

  Result AppendTransition(Transaction&, model::TransitionRecord&) override;
  std::vector<model::TransitionRecord> GetTransitions(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered by id so listings are deterministic
    std::map<std::string, model::BackendRecord> backends;
    // key -> id of the live backend holding it
    std::unordered_map<std::string, std::string> live_by_key;

    std::map<std::string, model::WorkerRecord> workers;
    std::unordered_map<std::string, model::LeaseRecord> leases;

    std::vector<model::TransitionRecord> transitions;
    uint64_t next_sequence = 1;
  };

  std::mutex mutex_;
  State committed_;
};

}
