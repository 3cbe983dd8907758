#include "agent_registry.hpp"

namespace orchestrator::agent {

AgentRegistry::AgentRegistry(Factory factory) : factory_(std::move(factory)) {
}

void AgentRegistry::Register(const std::string& worker_id, std::shared_ptr<WorkerAgent> agent) {
  std::lock_guard lock(mutex_);
  agents_[worker_id] = std::move(agent);
}

void AgentRegistry::Connect(const std::string& worker_id, const std::string& address) {
  if (!factory_) return;
  Register(worker_id, factory_(worker_id, address));
}

void AgentRegistry::Remove(const std::string& worker_id) {
  std::lock_guard lock(mutex_);
  agents_.erase(worker_id);
}

std::shared_ptr<WorkerAgent> AgentRegistry::Find(const std::string& worker_id) const {
  std::lock_guard lock(mutex_);
  auto            it = agents_.find(worker_id);
  if (it == agents_.end()) return nullptr;
  return it->second;
}

} // namespace orchestrator::agent
