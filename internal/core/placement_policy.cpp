#include "placement_policy.hpp"

#include <stdexcept>

namespace orchestrator::core {

std::optional<std::string> LeastLoadedPolicy::SelectWorker(const std::vector<WorkerCandidate>& candidates, const std::string&) {
  const WorkerCandidate* best = nullptr;
  for (const auto& candidate : candidates) {
    if (!best || candidate.live_backends < best->live_backends) {
      best = &candidate;
    }
  }
  if (!best) return std::nullopt;
  return best->worker_id;
}

std::optional<std::string> RoundRobinPolicy::SelectWorker(const std::vector<WorkerCandidate>& candidates, const std::string&) {
  if (candidates.empty()) return std::nullopt;
  const auto slot = cursor_.fetch_add(1) % candidates.size();
  return candidates[slot].worker_id;
}

std::unique_ptr<PlacementPolicy> MakePlacementPolicy(std::string_view name) {
  if (name.empty() || name == "least_loaded") {
    return std::make_unique<LeastLoadedPolicy>();
  }
  if (name == "round_robin") {
    return std::make_unique<RoundRobinPolicy>();
  }
  throw std::invalid_argument("unknown placement policy: " + std::string(name));
}

} // namespace orchestrator::core
