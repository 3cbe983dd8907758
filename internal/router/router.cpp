#include "router.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/core/scheduler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::router {

using model::BackendState;
using observability::IntField;
using observability::StringField;

namespace {

double ElapsedMs(Router::Clock::time_point since) {
  return std::chrono::duration<double, std::milli>(Router::Clock::now() - since).count();
}

} // namespace

Router::Router(std::shared_ptr<store::StateStore> store, std::shared_ptr<core::Scheduler> scheduler,
               std::shared_ptr<Connector> connector, RouterOptions options)
    : store_(std::move(store)), scheduler_(std::move(scheduler)), connector_(std::move(connector)), options_(options),
      tracker_(std::make_shared<ConnectionTracker>()) {
  if (!store_ || !scheduler_ || !connector_) {
    throw std::invalid_argument("router requires a store, a scheduler and a connector");
  }
  if (options_.poll_interval.count() <= 0) {
    options_.poll_interval = std::chrono::milliseconds(250);
  }
  subscription_ = store_->Subscribe([this](const store::StateChange& change) { OnStateChange(change); });
}

Router::~Router() {
  Stop();
  store_->Unsubscribe(subscription_);
}

void Router::Start() {
  std::lock_guard<std::mutex> lock(monitor_mutex_);
  if (monitor_.joinable()) {
    return;
  }
  stopping_ = false;
  monitor_  = std::thread([this] { RunDrainMonitor(); });
}

void Router::Stop() {
  {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    stopping_ = true;
  }
  monitor_cv_.notify_all();
  if (monitor_.joinable()) {
    monitor_.join();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, waiters] : pending_) {
      for (auto& waiter : waiters) {
        waiter->signalled = true;
        waiter->cv.notify_all();
      }
    }
  }

  if (const auto closed = tracker_->CloseAll(); closed > 0) {
    ORCHESTRATOR_LOG_INFO("router stopped; connections closed", {IntField("count", static_cast<int64_t>(closed))});
  }
}

void Router::OnStateChange(const store::StateChange& change) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    cache_.erase(change.key);
    if (auto it = pending_.find(change.backend_id); it != pending_.end()) {
      for (auto& waiter : it->second) {
        waiter->signalled = true;
        waiter->cv.notify_all();
      }
    }
  }

  if (change.to == BackendState::kDraining) {
    if (tracker_->BeginDrain(change.backend_id, Clock::now() + options_.drain_grace)) {
      ORCHESTRATOR_LOG_INFO("draining backend with open connections",
                            {StringField("backend_id", change.backend_id),
                             IntField("open", static_cast<int64_t>(tracker_->OpenCount(change.backend_id)))});
    }
  } else if (model::IsTerminal(change.to)) {
    tracker_->CloseBackend(change.backend_id);
  }
}

void Router::InvalidateKey(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.erase(key);
}

store::BackendRecord Router::Resolve(const std::string& key) {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      if (it->second.expires_at > Clock::now()) {
        return it->second.backend;
      }
      cache_.erase(it);
    }
    generation = generation_;
  }

  auto backend = scheduler_->Acquire(key).backend;

  // Only Ready backends are cached, and only if no state change slipped in
  // while the store was being read.
  if (backend.state == BackendState::kReady) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation == generation_) {
      cache_[key] = CacheEntry{backend, Clock::now() + options_.cache_ttl};
    }
  }
  return backend;
}

void Router::RemoveWaiter(const std::string& backend_id, const std::shared_ptr<Waiter>& waiter) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(backend_id);
  if (it == pending_.end()) {
    return;
  }
  auto& waiters = it->second;
  waiters.erase(std::remove(waiters.begin(), waiters.end(), waiter), waiters.end());
  if (waiters.empty()) {
    pending_.erase(it);
    return;
  }
  // The new head may be parked on release order.
  for (auto& other : waiters) {
    other->cv.notify_all();
  }
}

std::shared_ptr<Router::Waiter> Router::AddWaiter(const std::string& backend_id) {
  auto waiter = std::make_shared<Waiter>();
  std::lock_guard<std::mutex> lock(mutex_);
  pending_[backend_id].push_back(waiter);
  return waiter;
}

store::BackendRecord Router::WaitForReady(const store::BackendRecord& backend, const std::shared_ptr<Waiter>& waiter,
                                          Clock::time_point deadline, const CancellationToken* cancel) {
  const auto started = Clock::now();

  auto fail = [&](const char* outcome) { observability::Metrics::Instance().ObserveRouteWaitMs(outcome, ElapsedMs(started)); };

  store::BackendRecord current = backend;
  while (true) {
    auto latest = store_->Get(backend.id);
    if (!latest) {
      fail("failed");
      throw util::BackendFailed("backend " + backend.id + " disappeared while waiting");
    }
    current = *latest;

    if (current.state == BackendState::kReady) {
      break;
    }
    if (model::IsTerminal(current.state)) {
      fail("failed");
      throw util::BackendFailed("backend " + backend.id + " is " + std::string(model::ToString(current.state)) +
                                (current.cause.empty() ? "" : ": " + current.cause));
    }
    if (current.state == BackendState::kDraining) {
      fail("failed");
      throw util::Unavailable("backend " + backend.id + " started draining before it became ready");
    }
    if (stopping_ || (cancel && cancel->Cancelled())) {
      fail("cancelled");
      throw util::Unavailable("route for key " + backend.key + " cancelled");
    }

    const auto now = Clock::now();
    if (now >= deadline) {
      fail("timeout");
      throw util::RouteTimeout("backend " + backend.id + " not ready within the wait budget");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    waiter->cv.wait_for(lock, std::min<Clock::duration>(options_.poll_interval, deadline - now),
                        [&] { return waiter->signalled; });
    waiter->signalled = false;
  }

  // Release in arrival order.
  {
    std::unique_lock<std::mutex> lock(mutex_);
    waiter->cv.wait(lock, [&] {
      auto it = pending_.find(backend.id);
      return it == pending_.end() || it->second.empty() || it->second.front() == waiter;
    });
  }

  observability::Metrics::Instance().ObserveRouteWaitMs("ready", ElapsedMs(started));
  return current;
}

std::shared_ptr<RoutedConnection> Router::Connect(const store::BackendRecord& backend) {
  std::unique_ptr<Connection> stream;
  try {
    stream = connector_->Dial(backend.address, options_.connect_timeout);
  } catch (const util::Unavailable& e) {
    InvalidateKey(backend.key);
    ORCHESTRATOR_LOG_WARN("dial failed", {StringField("backend_id", backend.id), StringField("address", backend.address),
                                          StringField("error", e.what())});
    throw;
  }
  return tracker_->Track(backend.id, backend.address, std::move(stream));
}

std::shared_ptr<RoutedConnection> Router::Route(const std::string& key, const CancellationToken* cancel) {
  if (key.empty()) {
    throw std::invalid_argument("routing key must not be empty");
  }
  if (stopping_) {
    throw util::Unavailable("router is stopping");
  }

  observability::SpanScope span("router.route");
  span.SetAttribute("key", key);
  const auto deadline = Clock::now() + options_.wait_timeout;

  // A cached backend may have gone terminal; one re-resolve goes to the store.
  for (int pass = 0; pass < 2; ++pass) {
    auto backend = Resolve(key);
    span.SetAttribute("backend_id", backend.id);

    switch (backend.state) {
      case BackendState::kReady:
        return Connect(backend);
      case BackendState::kScheduled:
      case BackendState::kLoading: {
        // The waiter stays at the head of the queue until its connection is
        // dialed, so connections open in arrival order.
        struct PendingGuard {
          Router*                       router;
          const std::string&            backend_id;
          const std::shared_ptr<Waiter> waiter;
          ~PendingGuard() {
            router->RemoveWaiter(backend_id, waiter);
          }
        } guard{this, backend.id, AddWaiter(backend.id)};
        return Connect(WaitForReady(backend, guard.waiter, deadline, cancel));
      }
      case BackendState::kDraining:
        throw util::Unavailable("backend for key " + key + " is draining; retry shortly");
      default:
        InvalidateKey(key);
        break;
    }
  }
  throw util::Unavailable("no live backend for key " + key);
}

size_t Router::PendingCount(const std::string& backend_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(backend_id);
  return it == pending_.end() ? 0 : it->second.size();
}

std::vector<std::string> Router::EnforceDrainDeadlines(Clock::time_point now) {
  auto expired = tracker_->CloseExpired(now);
  for (const auto& backend_id : expired) {
    ORCHESTRATOR_LOG_INFO("drain grace elapsed; connections closed", {StringField("backend_id", backend_id)});
    observability::Metrics::Instance().RecordDrainTimeout();
    try {
      store_->ApplyEvent(backend_id, model::BackendEvent::kExplicitTerminate, "drain grace elapsed");
    } catch (const std::exception& e) {
      ORCHESTRATOR_LOG_WARN("terminate after drain failed",
                            {StringField("backend_id", backend_id), StringField("error", e.what())});
    }
  }
  return expired;
}

void Router::RunDrainMonitor() {
  std::unique_lock<std::mutex> lock(monitor_mutex_);
  while (!stopping_) {
    monitor_cv_.wait_for(lock, options_.poll_interval, [this] { return stopping_.load(); });
    if (stopping_) {
      break;
    }
    lock.unlock();
    EnforceDrainDeadlines(Clock::now());
    lock.lock();
  }
}

} // namespace orchestrator::router
