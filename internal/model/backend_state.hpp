#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace orchestrator::model {

enum class BackendState : std::uint8_t {
  kUnspecified = 0,
  kScheduled   = 1,
  kLoading     = 2,
  kReady       = 3,
  kDraining    = 4,
  kTerminated  = 5,
  kLost        = 6,
  kFailed      = 7,
};

enum class BackendEvent : std::uint8_t {
  kWorkerAcceptedPlacement,
  kWorkerReportedReady,
  kWorkerReportedHealthFailure,
  kDrainRequested,
  kWorkerReportedTerminated,
  kLeaseExpired,
  kExplicitTerminate,
};

enum class WorkerStatus : std::uint8_t {
  kUnspecified = 0,
  kActive      = 1,
  kDraining    = 2,
  kLost        = 3,
};

constexpr bool IsTerminal(BackendState state) {
  return state == BackendState::kTerminated || state == BackendState::kLost || state == BackendState::kFailed;
}

// Holds its key: at most one backend per key may be live.
constexpr bool IsLive(BackendState state) {
  return state == BackendState::kScheduled || state == BackendState::kLoading || state == BackendState::kReady ||
         state == BackendState::kDraining;
}

// Live and still accepting new traffic for its key.
constexpr bool IsRoutable(BackendState state) {
  return state == BackendState::kScheduled || state == BackendState::kLoading || state == BackendState::kReady;
}

/*
  Edges of the lifecycle graph. Used to validate compare-and-transition
  requests that name a target state directly and to check replayed logs.
*/
constexpr bool CanTransition(BackendState from, BackendState to) {
  switch (from) {
    case BackendState::kScheduled:
      return to == BackendState::kLoading || to == BackendState::kDraining || to == BackendState::kLost ||
             to == BackendState::kFailed;
    case BackendState::kLoading:
      return to == BackendState::kReady || to == BackendState::kDraining || to == BackendState::kLost ||
             to == BackendState::kFailed;
    case BackendState::kReady:
      return to == BackendState::kDraining || to == BackendState::kLost;
    case BackendState::kDraining:
      return to == BackendState::kTerminated;
    default:
      return false;
  }
}

enum class Decision : std::uint8_t {
  kApply,
  kNoOp,
  kReject,
};

struct TransitionDecision {
  Decision     decision = Decision::kReject;
  BackendState next     = BackendState::kUnspecified;

  static constexpr TransitionDecision Apply(BackendState next) {
    return {Decision::kApply, next};
  }
  static constexpr TransitionDecision NoOp(BackendState current) {
    return {Decision::kNoOp, current};
  }
  static constexpr TransitionDecision Reject(BackendState current) {
    return {Decision::kReject, current};
  }
};

/*
  Pure, total transition function.

  NoOp marks a duplicate of an event that has already taken effect (two
  heartbeats racing, a re-delivered report). Reject marks an event that does
  not apply to the current state. Neither is an error.
*/
constexpr TransitionDecision Decide(BackendState current, BackendEvent event) {
  using S = BackendState;
  using E = BackendEvent;

  if (IsTerminal(current)) {
    if (current == S::kTerminated && event == E::kWorkerReportedTerminated) {
      return TransitionDecision::NoOp(current);
    }
    return TransitionDecision::Reject(current);
  }

  switch (event) {
    case E::kWorkerAcceptedPlacement:
      if (current == S::kScheduled) return TransitionDecision::Apply(S::kLoading);
      if (current == S::kUnspecified) return TransitionDecision::Reject(current);
      return TransitionDecision::NoOp(current);

    case E::kWorkerReportedReady:
      if (current == S::kLoading) return TransitionDecision::Apply(S::kReady);
      if (current == S::kReady || current == S::kDraining) return TransitionDecision::NoOp(current);
      return TransitionDecision::Reject(current);

    case E::kWorkerReportedHealthFailure:
      if (current == S::kScheduled || current == S::kLoading) return TransitionDecision::Apply(S::kFailed);
      if (current == S::kReady) return TransitionDecision::Apply(S::kDraining);
      if (current == S::kDraining) return TransitionDecision::NoOp(current);
      return TransitionDecision::Reject(current);

    case E::kDrainRequested:
      if (current == S::kDraining) return TransitionDecision::NoOp(current);
      if (IsRoutable(current)) return TransitionDecision::Apply(S::kDraining);
      return TransitionDecision::Reject(current);

    case E::kWorkerReportedTerminated:
      if (current == S::kDraining) return TransitionDecision::Apply(S::kTerminated);
      if (current == S::kScheduled || current == S::kLoading) return TransitionDecision::Apply(S::kFailed);
      return TransitionDecision::Reject(current);

    case E::kLeaseExpired:
      if (current == S::kDraining) return TransitionDecision::Apply(S::kTerminated);
      if (IsRoutable(current)) return TransitionDecision::Apply(S::kLost);
      return TransitionDecision::Reject(current);

    case E::kExplicitTerminate:
      if (current == S::kDraining) return TransitionDecision::Apply(S::kTerminated);
      return TransitionDecision::Reject(current);
  }

  return TransitionDecision::Reject(current);
}

struct LoggedTransition {
  BackendState from    = BackendState::kUnspecified;
  BackendState to      = BackendState::kUnspecified;
  uint64_t     version = 0;
};

/*
  Validates a recorded walk and returns the state it ends in.

  The walk must start Unspecified -> Scheduled at version 1, continue from the
  previous target with consecutive versions, and follow CanTransition edges.
  Throws util::InvalidTransition naming the first bad entry.
*/
BackendState ReplayLog(const std::vector<LoggedTransition>& entries);

std::string_view ToString(BackendState state);
std::string_view ToString(BackendEvent event);
std::string_view ToString(WorkerStatus status);

std::optional<BackendState> BackendStateFromString(std::string_view name);

} // namespace orchestrator::model
