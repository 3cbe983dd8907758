#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace orchestrator::agent {

struct PlacementSpec {
  std::string               backend_id;
  std::string               key;
  uint64_t                  worker_epoch = 0;
  std::chrono::milliseconds lease_duration{0};
};

struct PlacementReply {
  bool        accepted = false;
  std::string reason;
};

/*
  Command side of a worker: how the orchestrator asks a worker to start or
  drain a backend. Readiness comes back asynchronously through reports.

  Transport failures and timeouts are thrown as util::PlacementFailed
  (PlaceBackend) or util::Unavailable (DrainBackend).
*/
class WorkerAgent {
 public:
  virtual ~WorkerAgent() = default;

  virtual PlacementReply PlaceBackend(const PlacementSpec& spec, std::chrono::milliseconds timeout) = 0;

  virtual void DrainBackend(const std::string& backend_id, std::chrono::milliseconds timeout) = 0;
};

} // namespace orchestrator::agent
