#include "scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

#include "internal/agent/agent_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::core {

using model::BackendEvent;
using model::BackendState;
using model::WorkerStatus;
using observability::IntField;
using observability::StringField;

namespace {

BackendHandle Existing(const store::BackendRecord& backend) {
  if (backend.state == BackendState::kDraining) {
    throw util::Unavailable("backend for key " + backend.key + " is draining; retry shortly");
  }
  return BackendHandle{backend, false};
}

} // namespace

Scheduler::Scheduler(std::shared_ptr<store::StateStore> store, std::shared_ptr<agent::AgentRegistry> agents,
                     std::shared_ptr<PlacementPolicy> policy, SchedulerOptions options)
    : store_(std::move(store)), agents_(std::move(agents)), policy_(std::move(policy)), options_(options) {
  if (!store_ || !agents_ || !policy_) {
    throw std::invalid_argument("scheduler requires a store, an agent registry and a placement policy");
  }
  if (options_.max_placement_attempts == 0) {
    options_.max_placement_attempts = 1;
  }
}

std::vector<WorkerCandidate> Scheduler::EligibleWorkers(const std::unordered_set<std::string>& excluded) {
  std::unordered_map<std::string, uint32_t> load;
  for (const auto& backend : store_->ListLive()) {
    ++load[backend.worker_id];
  }

  std::vector<WorkerCandidate> candidates;
  for (const auto& worker : store_->ListWorkers()) {
    if (worker.status != WorkerStatus::kActive || excluded.contains(worker.id)) continue;
    const auto live = load[worker.id];
    if (worker.capacity_hint > 0 && live >= worker.capacity_hint) continue;
    candidates.push_back(WorkerCandidate{worker.id, live, worker.capacity_hint});
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const WorkerCandidate& a, const WorkerCandidate& b) { return a.worker_id < b.worker_id; });
  return candidates;
}

store::BackendRecord Scheduler::Place(const store::ReserveResult& reserved) {
  const auto& backend = reserved.backend;

  auto agent = agents_->Find(backend.worker_id);
  if (!agent) {
    throw util::PlacementFailed("no agent connected for worker " + backend.worker_id);
  }

  agent::PlacementSpec spec;
  spec.backend_id     = backend.id;
  spec.key            = backend.key;
  spec.worker_epoch   = reserved.worker_epoch;
  spec.lease_duration = options_.lease_duration;

  agent::PlacementReply reply;
  try {
    reply = agent->PlaceBackend(spec, options_.placement_timeout);
  } catch (const util::PlacementFailed&) {
    DrainAbandoned(*agent, backend);
    throw;
  }
  if (!reply.accepted) {
    throw util::PlacementFailed("worker " + backend.worker_id + " rejected placement: " + reply.reason);
  }

  // A fast worker may already have reported Ready; Accepted is then a NoOp.
  return store_->ApplyEvent(backend.id, BackendEvent::kWorkerAcceptedPlacement, "worker accepted placement").backend;
}

void Scheduler::DrainAbandoned(agent::WorkerAgent& agent, const store::BackendRecord& backend) {
  try {
    agent.DrainBackend(backend.id, options_.drain_timeout);
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_WARN("drain after failed placement failed; a late ready report drains it",
                          {StringField("backend_id", backend.id), StringField("worker_id", backend.worker_id),
                           StringField("error", e.what())});
  }
}

BackendHandle Scheduler::Acquire(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("key must not be empty");
  }

  observability::SpanScope span("scheduler.acquire");
  span.SetAttribute("key", key);

  std::unordered_set<std::string> excluded;
  std::string                     last_error = "no eligible worker";

  for (uint32_t attempt = 1; attempt <= options_.max_placement_attempts; ++attempt) {
    if (auto existing = store_->GetByKey(key)) {
      return Existing(*existing);
    }

    const auto candidates = EligibleWorkers(excluded);
    auto       worker_id  = policy_->SelectWorker(candidates, key);
    if (!worker_id) {
      break;
    }

    auto reserved = store_->Reserve(key, *worker_id, options_.lease_duration, "acquire");
    if (!reserved.reserved) {
      return Existing(reserved.backend);
    }

    try {
      auto placed = Place(reserved);
      observability::Metrics::Instance().RecordPlacement(true);
      span.SetAttribute("backend_id", placed.id);
      span.SetAttribute("worker_id", placed.worker_id);
      return BackendHandle{placed, true};
    } catch (const util::PlacementFailed& e) {
      last_error = e.what();
    }

    observability::Metrics::Instance().RecordPlacement(false);
    ORCHESTRATOR_LOG_WARN("placement failed", {StringField("key", key), StringField("backend_id", reserved.backend.id),
                                               StringField("worker_id", *worker_id), IntField("attempt", attempt),
                                               StringField("error", last_error)});
    store_->ApplyEvent(reserved.backend.id, BackendEvent::kWorkerReportedHealthFailure, "placement failed: " + last_error);
    excluded.insert(*worker_id);
  }

  span.RecordException(last_error);
  throw util::SchedulingFailed("could not place backend for key " + key + ": " + last_error);
}

store::BackendRecord Scheduler::Terminate(const std::string& backend_id) {
  auto result = store_->ApplyEvent(backend_id, BackendEvent::kDrainRequested, "terminate requested");
  const auto& backend = result.backend;
  if (backend.state != BackendState::kDraining) {
    return backend;
  }

  auto agent = agents_->Find(backend.worker_id);
  if (!agent) {
    ORCHESTRATOR_LOG_WARN("no agent for drain; lease expiry will reclaim",
                          {StringField("backend_id", backend.id), StringField("worker_id", backend.worker_id)});
    return backend;
  }

  try {
    agent->DrainBackend(backend.id, options_.drain_timeout);
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_WARN("drain command failed; lease expiry will reclaim",
                          {StringField("backend_id", backend.id), StringField("worker_id", backend.worker_id),
                           StringField("error", e.what())});
  }
  return backend;
}

store::WorkerRecord Scheduler::DrainWorker(const std::string& worker_id) {
  store_->SetWorkerStatus(worker_id, WorkerStatus::kDraining);
  auto worker = store_->GetWorker(worker_id);
  if (!worker) {
    throw util::NotFound("worker not found: " + worker_id);
  }
  ORCHESTRATOR_LOG_INFO("worker draining", {StringField("worker_id", worker_id)});
  return *worker;
}

RecoveryReport Scheduler::Recover(uint64_t now_ms) {
  RecoveryReport report;
  const auto     placement_timeout_ms = static_cast<uint64_t>(options_.placement_timeout.count());

  for (const auto& backend : store_->ListLive()) {
    ++report.checked;

    std::vector<model::LoggedTransition> walk;
    for (const auto& entry : store_->History(backend.id)) {
      walk.push_back(model::LoggedTransition{entry.from_state, entry.to_state, entry.version});
    }
    try {
      const auto replayed = model::ReplayLog(walk);
      if (replayed != backend.state || walk.empty() || walk.back().version != backend.version) {
        throw util::InvalidTransition("log ends in " + std::string(model::ToString(replayed)) + " but backend is " +
                                      std::string(model::ToString(backend.state)));
      }
    } catch (const util::InvalidTransition& e) {
      ++report.invalid_logs;
      ORCHESTRATOR_LOG_ERROR("transition log does not match backend",
                             {StringField("backend_id", backend.id), StringField("error", e.what())});
    }

    if (backend.state == BackendState::kScheduled && backend.created_at_ms + placement_timeout_ms < now_ms) {
      auto result = store_->ApplyEvent(backend.id, BackendEvent::kWorkerReportedHealthFailure,
                                       "placement outcome lost across restart");
      if (result.outcome == store::ApplyOutcome::kApplied) {
        ++report.failed_placements;
      }
    }
  }

  ORCHESTRATOR_LOG_INFO("recovery complete", {IntField("checked", static_cast<int64_t>(report.checked)),
                                              IntField("invalid_logs", static_cast<int64_t>(report.invalid_logs)),
                                              IntField("failed_placements", static_cast<int64_t>(report.failed_placements))});
  return report;
}

} // namespace orchestrator::core
