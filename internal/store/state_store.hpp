#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/backend_state.hpp"

namespace orchestrator::store {

using db::model::BackendRecord;
using db::model::LeaseRecord;
using db::model::TransitionRecord;
using db::model::WorkerRecord;

struct StoreOptions {
  // Attempts per operation for transient store errors and lost CAS races.
  uint32_t                  max_attempts    = 8;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(2);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(100);
};

struct ReserveResult {
  // false: a live backend already held the key and `backend` is that backend.
  bool          reserved = false;
  BackendRecord backend;
  // Epoch the new lease was issued under; 0 when not reserved.
  uint64_t worker_epoch = 0;
};

enum class ApplyOutcome {
  kApplied,
  kNoOp,
  kRejected,
};

struct ApplyResult {
  ApplyOutcome  outcome = ApplyOutcome::kRejected;
  BackendRecord backend;
};

// Published after commit for every applied transition.
struct StateChange {
  std::string         backend_id;
  std::string         key;
  std::string         worker_id;
  std::string         address;
  model::BackendState from    = model::BackendState::kUnspecified;
  model::BackendState to      = model::BackendState::kUnspecified;
  uint64_t            version = 0;
};

using StateListener = std::function<void(const StateChange&)>;

/*
  StateStore

  Authoritative record of backends, workers, leases and the transition log.
  Every operation runs in one repository transaction. Store-level races are
  retried with bounded exponential backoff and surface as util::Unavailable
  once the budget is spent.
*/
class StateStore {
 public:
  explicit StateStore(std::shared_ptr<db::Repository> repository, StoreOptions options = {});

  // ---------------------------------------------------------------------
  // Backends
  // ---------------------------------------------------------------------

  // Creates the backend in Scheduled at version 1, its lease under the
  // worker's current epoch and the first log entry. Throws util::NotFound
  // if the worker is not registered.
  ReserveResult Reserve(const std::string& key, const std::string& worker_id, std::chrono::milliseconds lease_duration,
                        const std::string& cause);

  // Single-shot CAS. Throws NotFound, VersionMismatch or InvalidTransition.
  // Returns the new version.
  uint64_t CompareAndTransition(const std::string& id, uint64_t expected_version, model::BackendState target,
                                const std::string& cause, const std::optional<std::string>& address = std::nullopt);

  // Read, decide, CAS; retried on lost races. Throws NotFound.
  ApplyResult ApplyEvent(const std::string& id, model::BackendEvent event, const std::string& cause,
                         const std::optional<std::string>& address = std::nullopt);

  // Applies LeaseExpired if the backend's lease is still active and expired
  // at now_ms, in the same transaction as the check. Leases with nothing
  // left to reclaim are retired.
  ApplyResult ExpireLease(const std::string& backend_id, uint64_t now_ms);

  std::optional<BackendRecord> Get(const std::string& id);
  std::optional<BackendRecord> GetByKey(const std::string& key);
  std::vector<BackendRecord>   ListBackends();
  std::vector<BackendRecord>   ListLive();
  std::vector<BackendRecord>   ListByWorker(const std::string& worker_id);

  // ---------------------------------------------------------------------
  // Transition log
  // ---------------------------------------------------------------------

  // Returns the assigned sequence.
  uint64_t                      AppendLogEntry(TransitionRecord entry);
  std::vector<TransitionRecord> History(const std::string& backend_id);

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  // New or returning worker: bumps the epoch and marks it Active.
  WorkerRecord RegisterWorker(const std::string& worker_id, const std::string& address, uint32_t capacity_hint);

  // Records the heartbeat and renews the worker's leases until now +
  // lease_duration. Throws NotFound, or StaleEpoch when `epoch` is not the
  // current one or the worker has been declared Lost.
  uint64_t Heartbeat(const std::string& worker_id, uint64_t epoch, std::chrono::milliseconds lease_duration);

  void                        SetWorkerStatus(const std::string& worker_id, model::WorkerStatus status);

  // Marks the worker Lost if, read in the same transaction, its last
  // heartbeat is older than now_ms - silence. Returns the record as it was
  // before the change, or nullopt when the worker is unknown, already Lost
  // or heard from in time.
  std::optional<WorkerRecord> MarkWorkerLostIfSilent(const std::string& worker_id, uint64_t now_ms,
                                                     std::chrono::milliseconds silence);
  std::vector<WorkerRecord>   ListWorkers();
  std::optional<WorkerRecord> GetWorker(const std::string& worker_id);

  // ---------------------------------------------------------------------
  // Leases
  // ---------------------------------------------------------------------

  uint64_t                    RenewLeases(const std::string& worker_id, uint64_t epoch, uint64_t until_ms);
  std::vector<LeaseRecord>    ExpiredLeases(uint64_t now_ms);
  std::optional<LeaseRecord>  GetLease(const std::string& backend_id);
  bool                        InvalidateLease(const std::string& backend_id);

  // ---------------------------------------------------------------------
  // Notifications and retention
  // ---------------------------------------------------------------------

  // Listeners run on the committing thread, after commit, outside any store
  // lock. They must not block.
  uint64_t Subscribe(StateListener listener);
  void     Unsubscribe(uint64_t subscription);

  uint64_t PurgeTerminal(uint64_t before_ms);

 private:
  template <typename Fn>
  auto RunInTransaction(const char* operation, Fn&& fn);

  void Finish(const ApplyResult& result, model::BackendState from, model::BackendEvent event);
  void Publish(const std::vector<StateChange>& changes);

  std::shared_ptr<db::Repository> repository_;
  StoreOptions                    options_;

  std::mutex                                        listeners_mutex_;
  std::vector<std::pair<uint64_t, StateListener>>   listeners_;
  uint64_t                                          next_subscription_ = 1;
};

} // namespace orchestrator::store
