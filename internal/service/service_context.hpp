#pragma once

#include <chrono>
#include <memory>

namespace orchestrator::store { class StateStore; }
namespace orchestrator::core { class Scheduler; }
namespace orchestrator::lease { class LeaseManager; }
namespace orchestrator::agent { class AgentRegistry; class ReportChannel; }

namespace orchestrator::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<orchestrator::store::StateStore> store;
  std::shared_ptr<orchestrator::core::Scheduler> scheduler;
  std::shared_ptr<orchestrator::lease::LeaseManager> leases;
  std::shared_ptr<orchestrator::agent::AgentRegistry> agents;
  std::shared_ptr<orchestrator::agent::ReportChannel> reports;
  // How long a report RPC waits for its report to commit.
  std::chrono::milliseconds report_apply_timeout{10000};
};

}
