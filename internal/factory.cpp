#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/agent/grpc_worker_agent.hpp"
#include "internal/agent/report_channel.hpp"
#include "internal/agent/report_dispatcher.hpp"
#include "internal/agent/report_handler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/worker_report_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/router/connector.hpp"
#include "internal/router/proxy_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/worker_report_service.hpp"
#include "internal/util/time.hpp"
#if ORCHESTRATOR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ORCHESTRATOR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace orchestrator::factory {

using namespace orchestrator;
using orchestrator::runtime::config::RuntimeConfig;
using orchestrator::util::DurationOr;
using std::chrono::milliseconds;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ORCHESTRATOR_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->Bootstrap();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ORCHESTRATOR_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

store::StoreOptions StoreOptionsFrom(const RuntimeConfig& config) {
  store::StoreOptions options;
  const auto&         retry = config.scheduler().store_retry();
  if (retry.max_attempts() > 0) {
    options.max_attempts = retry.max_attempts();
  }
  options.initial_backoff = DurationOr(retry.initial_backoff(), options.initial_backoff);
  options.max_backoff     = DurationOr(retry.max_backoff(), options.max_backoff);
  return options;
}

lease::LeaseOptions LeaseOptionsFrom(const RuntimeConfig& config) {
  lease::LeaseOptions options;
  options.heartbeat_interval = DurationOr(config.leases().heartbeat_interval(), options.heartbeat_interval);
  options.lease_duration     = DurationOr(config.leases().lease_duration(), milliseconds(0));
  options.sweep_interval     = DurationOr(config.leases().sweep_interval(), options.sweep_interval);
  options.terminal_retention = DurationOr(config.retention().terminal_retention(), milliseconds(0));
  return options;
}

core::SchedulerOptions SchedulerOptionsFrom(const RuntimeConfig& config, milliseconds lease_duration) {
  core::SchedulerOptions options;
  if (config.scheduler().max_placement_attempts() > 0) {
    options.max_placement_attempts = config.scheduler().max_placement_attempts();
  }
  options.placement_timeout = DurationOr(config.scheduler().placement_timeout(), options.placement_timeout);
  options.lease_duration    = lease_duration;
  return options;
}

router::RouterOptions RouterOptionsFrom(const RuntimeConfig& config) {
  router::RouterOptions options;
  options.wait_timeout    = DurationOr(config.router().wait_timeout(), options.wait_timeout);
  options.poll_interval   = DurationOr(config.router().poll_interval(), options.poll_interval);
  options.cache_ttl       = DurationOr(config.router().cache_ttl(), options.cache_ttl);
  options.drain_grace     = DurationOr(config.router().drain_grace(), options.drain_grace);
  options.connect_timeout = DurationOr(config.proxy().connect_timeout(), options.connect_timeout);
  return options;
}

Application Build(const RuntimeConfig& config, agent::AgentRegistry::Factory agent_factory) {
  Application app;

  // ------------------------------------------------------------------
  // State
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<store::StateStore>(app.repository, StoreOptionsFrom(config));

  // ------------------------------------------------------------------
  // Workers: agents, reports, leases
  // ------------------------------------------------------------------
  if (!agent_factory) {
    agent_factory = &agent::GrpcWorkerAgent::Connect;
  }
  app.agents     = std::make_shared<agent::AgentRegistry>(std::move(agent_factory));
  app.reports    = std::make_shared<agent::ReportChannel>();
  app.dispatcher = std::make_shared<agent::ReportDispatcher>(app.reports,
                                                             std::make_shared<agent::ReportHandler>(app.store, app.agents));
  app.leases     = std::make_shared<lease::LeaseManager>(app.store, LeaseOptionsFrom(config), app.agents);

  // Agents for workers that registered with a previous process.
  for (const auto& worker : app.store->ListWorkers()) {
    if (worker.status != model::WorkerStatus::kLost && !worker.address.empty()) {
      app.agents->Connect(worker.id, worker.address);
    }
  }

  // ------------------------------------------------------------------
  // Scheduling and routing
  // ------------------------------------------------------------------
  auto policy   = core::MakePlacementPolicy(config.scheduler().placement_policy());
  app.scheduler = std::make_shared<core::Scheduler>(app.store, app.agents, std::move(policy),
                                                    SchedulerOptionsFrom(config, app.leases->LeaseDuration()));
  app.router    = std::make_shared<router::Router>(app.store, app.scheduler, std::make_shared<router::TcpConnector>(),
                                                RouterOptionsFrom(config));

  if (!config.proxy().bind_address().empty()) {
    router::ProxyOptions proxy_options;
    proxy_options.bind_address = config.proxy().bind_address();
    app.proxy                  = std::make_shared<router::ProxyServer>(app.router, proxy_options);
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store     = app.store;
  ctx.scheduler = app.scheduler;
  ctx.leases    = app.leases;
  ctx.agents    = app.agents;
  ctx.reports   = app.reports;

  app.admin_service  = std::make_shared<service::AdminService>(ctx);
  app.report_service = std::make_shared<service::WorkerReportService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.admin_service));
  app.grpc_services.push_back(std::make_unique<grpc::WorkerReportServer>(app.report_service));

  return app;
}

void Application::Start() {
  scheduler->Recover(util::NowMillis());
  dispatcher->Start();
  leases->Start();
  router->Start();
  if (proxy) {
    proxy->Start();
  }
}

void Application::Stop() {
  if (proxy) {
    proxy->Stop();
  }
  router->Stop();
  leases->Stop();
  // Applies reports still queued; their RPCs are waiting on them.
  dispatcher->Stop();
}

} // namespace orchestrator::factory
