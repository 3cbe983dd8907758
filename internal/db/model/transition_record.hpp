#pragma once

#include <cstdint>
#include <string>

#include "internal/model/backend_state.hpp"

namespace orchestrator::db::model {

/*
  Append-only transition log entry.

  sequence is assigned by the repository on append and is strictly
  increasing across the whole log.
*/
struct TransitionRecord {
  uint64_t    sequence = 0;
  std::string backend_id;

  orchestrator::model::BackendState from_state = orchestrator::model::BackendState::kUnspecified;
  orchestrator::model::BackendState to_state   = orchestrator::model::BackendState::kUnspecified;

  // Backend version after the transition
  uint64_t version = 0;

  uint64_t    at_ms = 0;
  std::string cause;
};

} // namespace orchestrator::db::model
