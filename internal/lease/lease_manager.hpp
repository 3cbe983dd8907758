#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace orchestrator::store {
class StateStore;
}

namespace orchestrator::agent {
class AgentRegistry;
}

namespace orchestrator::lease {

struct LeaseOptions {
  std::chrono::milliseconds heartbeat_interval = std::chrono::milliseconds(5000);
  // 0 = 3 x heartbeat_interval
  std::chrono::milliseconds lease_duration = std::chrono::milliseconds(0);
  std::chrono::milliseconds sweep_interval = std::chrono::milliseconds(1000);
  // 0 = keep terminal backends forever
  std::chrono::milliseconds terminal_retention = std::chrono::milliseconds(0);
};

struct SweepReport {
  uint64_t expired      = 0;
  uint64_t workers_lost = 0;
  uint64_t purged       = 0;
};

/*
  Lease lifecycle.

  Leases are issued by StateStore::Reserve together with the backend and
  renewed by worker heartbeats under the worker's current epoch. The sweeper
  thread reclaims what heartbeats stopped renewing:

      expired lease      -> LeaseExpired (Lost, or Terminated when Draining)
      silent worker      -> worker Lost, its agent handle dropped
      old terminal rows  -> purged (when retention is configured)
*/
class LeaseManager {
 public:
  LeaseManager(std::shared_ptr<store::StateStore> store, LeaseOptions options,
               std::shared_ptr<agent::AgentRegistry> agents = nullptr);
  ~LeaseManager();

  std::chrono::milliseconds LeaseDuration() const {
    return options_.lease_duration;
  }
  std::chrono::milliseconds HeartbeatInterval() const {
    return options_.heartbeat_interval;
  }

  // Returns the number of leases renewed. Throws StaleEpoch / NotFound.
  uint64_t Heartbeat(const std::string& worker_id, uint64_t epoch);

  // One sweep pass at `now_ms`. Exposed for deterministic tests.
  SweepReport SweepOnce(uint64_t now_ms);

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<store::StateStore>    store_;
  std::shared_ptr<agent::AgentRegistry> agents_;
  LeaseOptions                          options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace orchestrator::lease
