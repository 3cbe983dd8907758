#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/store/state_store.hpp"
#include "placement_policy.hpp"

namespace orchestrator::agent {
class AgentRegistry;
class WorkerAgent;
}

namespace orchestrator::core {

struct SchedulerOptions {
  uint32_t                  max_placement_attempts = 3;
  std::chrono::milliseconds placement_timeout      = std::chrono::milliseconds(5000);
  std::chrono::milliseconds lease_duration         = std::chrono::milliseconds(15000);
  // Agent deadline for drain commands.
  std::chrono::milliseconds drain_timeout = std::chrono::milliseconds(5000);
};

struct BackendHandle {
  store::BackendRecord backend;
  // true when this call reserved the backend
  bool created = false;
};

struct RecoveryReport {
  uint64_t checked           = 0;
  uint64_t invalid_logs      = 0;
  uint64_t failed_placements = 0;
};

/*
  Scheduler

  Owns acquire(key): at most one live backend per key, placed on a worker
  chosen by the placement policy, retried on other workers when placement
  fails. Concurrent acquires for the same key converge on the backend that
  won the reservation.
*/
class Scheduler {
 public:
  Scheduler(std::shared_ptr<store::StateStore> store, std::shared_ptr<agent::AgentRegistry> agents,
            std::shared_ptr<PlacementPolicy> policy, SchedulerOptions options);

  // Live (routable) backend for `key`, scheduling one if needed.
  // Throws util::Unavailable while the key's backend drains and
  // util::SchedulingFailed when no worker accepts the placement.
  BackendHandle Acquire(const std::string& key);

  // DrainRequested plus a drain command to the owning agent. Never removes
  // the backend directly; it terminates when the worker reports or its
  // lease runs out.
  store::BackendRecord Terminate(const std::string& backend_id);

  // Stops new placements on the worker. Existing backends keep running.
  store::WorkerRecord DrainWorker(const std::string& worker_id);

  // Startup reconciliation: validates the log of every live backend and
  // fails Scheduled backends whose placement outcome died with the
  // previous process.
  RecoveryReport Recover(uint64_t now_ms);

  const PlacementPolicy& Policy() const {
    return *policy_;
  }

 private:
  std::vector<WorkerCandidate> EligibleWorkers(const std::unordered_set<std::string>& excluded);

  // Sends the placement; on success the backend is Loading (or further).
  // Throws util::PlacementFailed. After a timeout or transport error the
  // worker is told to drain whatever it may have started.
  store::BackendRecord Place(const store::ReserveResult& reserved);

  void DrainAbandoned(agent::WorkerAgent& agent, const store::BackendRecord& backend);

  std::shared_ptr<store::StateStore>    store_;
  std::shared_ptr<agent::AgentRegistry> agents_;
  std::shared_ptr<PlacementPolicy>      policy_;
  SchedulerOptions                      options_;
};

} // namespace orchestrator::core
