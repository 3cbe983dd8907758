#include "lease_manager.hpp"

#include <stdexcept>

#include "internal/agent/agent_registry.hpp"
#include "internal/model/backend_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/time.hpp"

namespace orchestrator::lease {

using model::WorkerStatus;
using observability::DurationField;
using observability::IntField;
using observability::StateField;
using observability::StringField;

LeaseManager::LeaseManager(std::shared_ptr<store::StateStore> store, LeaseOptions options,
                           std::shared_ptr<agent::AgentRegistry> agents)
    : store_(std::move(store)), agents_(std::move(agents)), options_(options) {
  if (!store_) {
    throw std::invalid_argument("lease manager requires a state store");
  }
  if (options_.heartbeat_interval.count() <= 0) {
    options_.heartbeat_interval = std::chrono::milliseconds(5000);
  }
  if (options_.lease_duration.count() <= 0) {
    options_.lease_duration = options_.heartbeat_interval * 3;
  }
  if (options_.sweep_interval.count() <= 0) {
    options_.sweep_interval = std::chrono::milliseconds(1000);
  }
}

LeaseManager::~LeaseManager() {
  Stop();
}

uint64_t LeaseManager::Heartbeat(const std::string& worker_id, uint64_t epoch) {
  return store_->Heartbeat(worker_id, epoch, options_.lease_duration);
}

SweepReport LeaseManager::SweepOnce(uint64_t now_ms) {
  SweepReport report;

  for (const auto& lease : store_->ExpiredLeases(now_ms)) {
    try {
      auto result = store_->ExpireLease(lease.backend_id, now_ms);
      if (result.outcome == store::ApplyOutcome::kApplied) {
        ++report.expired;
        observability::Metrics::Instance().RecordLeaseExpiry(model::ToString(result.backend.state));
        ORCHESTRATOR_LOG_WARN("lease expired", {StringField("backend_id", lease.backend_id),
                                                StringField("worker_id", lease.worker_id),
                                                StateField("state", result.backend.state)});
      }
    } catch (const std::exception& e) {
      ORCHESTRATOR_LOG_ERROR("lease expiry failed",
                             {StringField("backend_id", lease.backend_id), StringField("error", e.what())});
    }
  }

  for (const auto& candidate : store_->ListWorkers()) {
    if (candidate.status == WorkerStatus::kLost) continue;
    try {
      // The listing may be stale by now; the store re-reads the heartbeat.
      auto worker = store_->MarkWorkerLostIfSilent(candidate.id, now_ms, options_.lease_duration);
      if (!worker) continue;

      ++report.workers_lost;
      if (agents_) {
        agents_->Remove(worker->id);
      }
      observability::Metrics::Instance().RecordWorkerLost();
      ORCHESTRATOR_LOG_WARN("worker lost", {StringField("worker_id", worker->id),
                                            IntField("epoch", static_cast<int64_t>(worker->epoch)),
                                            DurationField("silent", std::chrono::milliseconds(now_ms - worker->last_heartbeat_at_ms))});
    } catch (const std::exception& e) {
      ORCHESTRATOR_LOG_ERROR("marking worker lost failed", {StringField("worker_id", candidate.id), StringField("error", e.what())});
    }
  }

  const auto retention_ms = static_cast<uint64_t>(options_.terminal_retention.count());
  if (retention_ms > 0 && now_ms > retention_ms) {
    report.purged = store_->PurgeTerminal(now_ms - retention_ms);
    if (report.purged > 0) {
      ORCHESTRATOR_LOG_INFO("purged terminal backends", {IntField("count", static_cast<int64_t>(report.purged))});
    }
  }

  return report;
}

void LeaseManager::Start() {
  if (running_.exchange(true)) return;
  ORCHESTRATOR_LOG_INFO("lease sweeper started", {DurationField("lease_duration", options_.lease_duration),
                                                  DurationField("sweep_interval", options_.sweep_interval)});
  thread_ = std::thread(&LeaseManager::Run, this);
}

void LeaseManager::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LeaseManager::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, options_.sweep_interval, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      SweepOnce(util::NowMillis());
    } catch (const std::exception& e) {
      ORCHESTRATOR_LOG_ERROR("lease sweep failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace orchestrator::lease
