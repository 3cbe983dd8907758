#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "worker_agent.hpp"

namespace orchestrator::agent {

/*
  worker id -> agent handle.

  Entries are (re)created when a worker registers and point at the agent
  address it announced. The map is advisory; the store decides membership.
*/
class AgentRegistry {
 public:
  using Factory = std::function<std::shared_ptr<WorkerAgent>(const std::string& worker_id, const std::string& address)>;

  AgentRegistry() = default;
  explicit AgentRegistry(Factory factory);

  // Replaces any previous handle for the worker.
  void Register(const std::string& worker_id, std::shared_ptr<WorkerAgent> agent);

  // Builds a handle with the factory; no-op without one.
  void Connect(const std::string& worker_id, const std::string& address);

  void Remove(const std::string& worker_id);

  std::shared_ptr<WorkerAgent> Find(const std::string& worker_id) const;

 private:
  Factory factory_;

  mutable std::mutex                                            mutex_;
  std::unordered_map<std::string, std::shared_ptr<WorkerAgent>> agents_;
};

} // namespace orchestrator::agent
