#pragma once

#include <cstdint>
#include <string>

#include "internal/model/backend_state.hpp"

namespace orchestrator::db::model {

/*
  Persistent backend row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - Version is bumped by exactly one on every applied transition and is the
    compare-and-set token for all writers.
  - worker_id is fixed when the placement decision is recorded.
*/

struct BackendRecord {
  std::string id;
  std::string key;

  orchestrator::model::BackendState state = orchestrator::model::BackendState::kUnspecified;

  std::string worker_id;

  // host:port, empty until Ready
  std::string address;

  uint64_t version = 0;

  uint64_t created_at_ms             = 0;
  uint64_t last_state_change_at_ms   = 0;

  // Cause recorded with the last transition
  std::string cause;
};

} // namespace orchestrator::db::model
