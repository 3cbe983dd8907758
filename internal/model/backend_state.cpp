#include "internal/model/backend_state.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace orchestrator::model {

std::string_view ToString(BackendState state) {
  switch (state) {
    case BackendState::kScheduled:
      return "scheduled";
    case BackendState::kLoading:
      return "loading";
    case BackendState::kReady:
      return "ready";
    case BackendState::kDraining:
      return "draining";
    case BackendState::kTerminated:
      return "terminated";
    case BackendState::kLost:
      return "lost";
    case BackendState::kFailed:
      return "failed";
    default:
      return "unspecified";
  }
}

std::string_view ToString(BackendEvent event) {
  switch (event) {
    case BackendEvent::kWorkerAcceptedPlacement:
      return "worker_accepted_placement";
    case BackendEvent::kWorkerReportedReady:
      return "worker_reported_ready";
    case BackendEvent::kWorkerReportedHealthFailure:
      return "worker_reported_health_failure";
    case BackendEvent::kDrainRequested:
      return "drain_requested";
    case BackendEvent::kWorkerReportedTerminated:
      return "worker_reported_terminated";
    case BackendEvent::kLeaseExpired:
      return "lease_expired";
    case BackendEvent::kExplicitTerminate:
      return "explicit_terminate";
  }
  return "unknown";
}

std::string_view ToString(WorkerStatus status) {
  switch (status) {
    case WorkerStatus::kActive:
      return "active";
    case WorkerStatus::kDraining:
      return "draining";
    case WorkerStatus::kLost:
      return "lost";
    default:
      return "unspecified";
  }
}

std::optional<BackendState> BackendStateFromString(std::string_view name) {
  for (auto state : {BackendState::kScheduled, BackendState::kLoading, BackendState::kReady, BackendState::kDraining,
                     BackendState::kTerminated, BackendState::kLost, BackendState::kFailed}) {
    if (ToString(state) == name) {
      return state;
    }
  }
  return std::nullopt;
}

BackendState ReplayLog(const std::vector<LoggedTransition>& entries) {
  auto     state   = BackendState::kUnspecified;
  uint64_t version = 0;

  for (const auto& entry : entries) {
    const bool first = version == 0;
    const bool edge  = first ? entry.to == BackendState::kScheduled : CanTransition(state, entry.to);
    if (entry.from != state || entry.version != version + 1 || !edge) {
      throw util::InvalidTransition("log entry at version " + std::to_string(entry.version) + " (" +
                                    std::string(ToString(entry.from)) + " -> " + std::string(ToString(entry.to)) +
                                    ") does not continue " + std::string(ToString(state)) + "@" +
                                    std::to_string(version));
    }
    state   = entry.to;
    version = entry.version;
  }
  return state;
}

} // namespace orchestrator::model
