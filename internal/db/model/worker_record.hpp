#pragma once

#include <cstdint>
#include <string>

#include "internal/model/backend_state.hpp"

namespace orchestrator::db::model {

struct WorkerRecord {
  std::string id;

  orchestrator::model::WorkerStatus status = orchestrator::model::WorkerStatus::kUnspecified;

  // Endpoint of the worker's agent service
  std::string address;

  // Incremented on every registration; fences leases of earlier sessions.
  uint64_t epoch = 0;

  // 0 = unlimited
  uint32_t capacity_hint = 0;

  uint64_t last_heartbeat_at_ms = 0;

  uint64_t version = 0;
};

} // namespace orchestrator::db::model
