#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orchestrator::core {

// An Active worker with spare capacity, as seen by the scheduler.
struct WorkerCandidate {
  std::string worker_id;
  uint32_t    live_backends = 0;
  // 0 = unlimited
  uint32_t capacity_hint = 0;
};

/*
  Chooses the worker for a new backend. Candidates arrive sorted by worker id
  and already filtered (Active, under capacity, not excluded for this
  acquire). Implementations must be thread-safe.
*/
class PlacementPolicy {
 public:
  virtual ~PlacementPolicy() = default;

  virtual std::optional<std::string> SelectWorker(const std::vector<WorkerCandidate>& candidates, const std::string& key) = 0;

  virtual std::string_view Name() const = 0;
};

// Fewest live backends; ties go to the lowest worker id.
class LeastLoadedPolicy final : public PlacementPolicy {
 public:
  std::optional<std::string> SelectWorker(const std::vector<WorkerCandidate>& candidates, const std::string& key) override;

  std::string_view Name() const override {
    return "least_loaded";
  }
};

class RoundRobinPolicy final : public PlacementPolicy {
 public:
  std::optional<std::string> SelectWorker(const std::vector<WorkerCandidate>& candidates, const std::string& key) override;

  std::string_view Name() const override {
    return "round_robin";
  }

 private:
  std::atomic<uint64_t> cursor_{0};
};

// "least_loaded" (also for empty) or "round_robin"; throws std::invalid_argument otherwise.
std::unique_ptr<PlacementPolicy> MakePlacementPolicy(std::string_view name);

} // namespace orchestrator::core
