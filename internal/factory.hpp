#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/agent/agent_registry.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/router/router.hpp"
#include "internal/store/state_store.hpp"

namespace orchestrator::agent {
class ReportChannel;
class ReportDispatcher;
}
namespace orchestrator::router {
class ProxyServer;
}
namespace orchestrator::service {
class AdminService;
class WorkerReportService;
}

namespace orchestrator::factory {

/*
  Application

  Owns every long-lived component. Start() brings the background threads
  up after startup recovery; Stop() takes them down in reverse order.
*/
struct Application {
  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<store::StateStore>               store;
  std::shared_ptr<agent::AgentRegistry>            agents;
  std::shared_ptr<agent::ReportChannel>            reports;
  std::shared_ptr<agent::ReportDispatcher>         dispatcher;
  std::shared_ptr<lease::LeaseManager>             leases;
  std::shared_ptr<core::Scheduler>                 scheduler;
  std::shared_ptr<router::Router>                  router;
  // null when proxy.bind_address is empty
  std::shared_ptr<router::ProxyServer>             proxy;
  std::shared_ptr<service::AdminService>           admin_service;
  std::shared_ptr<service::WorkerReportService>    report_service;
  std::vector<std::unique_ptr<::grpc::Service>>    grpc_services;

  void Start();
  void Stop();
};

// Concrete repository for config.database(), schema bootstrapped.
// Memory when no backend is configured.
std::shared_ptr<db::Repository> BuildRepository(const orchestrator::runtime::config::RuntimeConfig& config);

store::StoreOptions   StoreOptionsFrom(const orchestrator::runtime::config::RuntimeConfig& config);
lease::LeaseOptions   LeaseOptionsFrom(const orchestrator::runtime::config::RuntimeConfig& config);
core::SchedulerOptions SchedulerOptionsFrom(const orchestrator::runtime::config::RuntimeConfig& config,
                                            std::chrono::milliseconds lease_duration);
router::RouterOptions RouterOptionsFrom(const orchestrator::runtime::config::RuntimeConfig& config);

/*
  Build full application dependency graph.

  This is the composition root and the only place that knows concrete
  repository and agent transport types.
*/
Application Build(const orchestrator::runtime::config::RuntimeConfig& config,
                  agent::AgentRegistry::Factory agent_factory = {});

} // namespace orchestrator::factory
