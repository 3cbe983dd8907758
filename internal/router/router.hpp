#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "connection_tracker.hpp"
#include "connector.hpp"
#include "internal/store/state_store.hpp"

namespace orchestrator::core {
class Scheduler;
}

namespace orchestrator::router {

struct RouterOptions {
  // Budget for a connection waiting on a Scheduled/Loading backend.
  std::chrono::milliseconds wait_timeout    = std::chrono::milliseconds(30000);
  // Store re-read interval while waiting; also the drain monitor tick.
  std::chrono::milliseconds poll_interval   = std::chrono::milliseconds(250);
  std::chrono::milliseconds cache_ttl       = std::chrono::milliseconds(1000);
  std::chrono::milliseconds drain_grace     = std::chrono::milliseconds(30000);
  std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(5000);
};

/*
  Cancels one route() call. The check, if any, is consulted on every wait
  tick; the proxy uses it to notice a client that hung up.
*/
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::function<bool()> check) : check_(std::move(check)) {
  }

  void Cancel() {
    cancelled_.store(true);
  }

  bool Cancelled() const {
    return cancelled_.load() || (check_ && check_());
  }

 private:
  std::atomic<bool>     cancelled_{false};
  std::function<bool()> check_;
};

/*
  Router

  route(key) resolves the key's live backend (scheduling one if there is
  none) and returns a tracked connection to it. Connections for backends
  that are not Ready yet wait in a per-backend FIFO and are released in
  arrival order. Draining backends get no new connections; their open ones
  are force-closed after drain_grace and the backend is terminated.

  All router state is process-local.
*/
class Router {
 public:
  using Clock = std::chrono::steady_clock;

  Router(std::shared_ptr<store::StateStore> store, std::shared_ptr<core::Scheduler> scheduler,
         std::shared_ptr<Connector> connector, RouterOptions options);
  ~Router();

  Router(const Router&)            = delete;
  Router& operator=(const Router&) = delete;

  // Throws util::BackendFailed, util::RouteTimeout, util::Unavailable
  // (draining, cancelled, dial failure) or util::SchedulingFailed.
  std::shared_ptr<RoutedConnection> Route(const std::string& key, const CancellationToken* cancel = nullptr);

  // Starts the drain monitor.
  void Start();
  void Stop();

  // One drain monitor pass. Returns the backends whose grace elapsed.
  std::vector<std::string> EnforceDrainDeadlines(Clock::time_point now);

  size_t PendingCount(const std::string& backend_id) const;

  const ConnectionTracker& Connections() const {
    return *tracker_;
  }

 private:
  struct CacheEntry {
    store::BackendRecord backend;
    Clock::time_point    expires_at;
  };

  struct Waiter {
    bool                    signalled = false;
    std::condition_variable cv;
  };

  void OnStateChange(const store::StateChange& change);

  store::BackendRecord Resolve(const std::string& key);
  std::shared_ptr<Waiter> AddWaiter(const std::string& backend_id);
  // Returns once the backend is Ready and the waiter is at the head of its
  // queue. The caller removes the waiter.
  store::BackendRecord WaitForReady(const store::BackendRecord& backend, const std::shared_ptr<Waiter>& waiter,
                                    Clock::time_point deadline, const CancellationToken* cancel);
  std::shared_ptr<RoutedConnection> Connect(const store::BackendRecord& backend);

  void RemoveWaiter(const std::string& backend_id, const std::shared_ptr<Waiter>& waiter);
  void InvalidateKey(const std::string& key);
  void RunDrainMonitor();

  std::shared_ptr<store::StateStore> store_;
  std::shared_ptr<core::Scheduler>   scheduler_;
  std::shared_ptr<Connector>         connector_;
  RouterOptions                      options_;
  std::shared_ptr<ConnectionTracker> tracker_;
  uint64_t                           subscription_ = 0;

  mutable std::mutex                                                     mutex_;
  std::unordered_map<std::string, CacheEntry>                            cache_;
  std::unordered_map<std::string, std::deque<std::shared_ptr<Waiter>>>   pending_;
  uint64_t                                                               generation_ = 0;

  std::atomic<bool>       stopping_{false};
  std::mutex              monitor_mutex_;
  std::condition_variable monitor_cv_;
  std::thread             monitor_;
};

} // namespace orchestrator::router
