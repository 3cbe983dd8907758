#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/agent/agent_registry.hpp"
#include "internal/agent/report_channel.hpp"
#include "internal/agent/report_dispatcher.hpp"
#include "internal/agent/report_handler.hpp"
#include "internal/core/placement_policy.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/router/router.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/worker_report_service.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fakes.hpp"

#if ORCHESTRATOR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using namespace std::chrono_literals;

using orchestrator::agent::AgentRegistry;
using orchestrator::agent::ReportChannel;
using orchestrator::agent::ReportDispatcher;
using orchestrator::agent::ReportHandler;
using orchestrator::core::LeastLoadedPolicy;
using orchestrator::core::Scheduler;
using orchestrator::core::SchedulerOptions;
using orchestrator::db::Repository;
using orchestrator::db::memory::MemoryRepository;
using orchestrator::lease::LeaseManager;
using orchestrator::lease::LeaseOptions;
using orchestrator::model::BackendState;
using orchestrator::router::Router;
using orchestrator::router::RouterOptions;
using orchestrator::service::AdminService;
using orchestrator::service::ServiceContext;
using orchestrator::service::WorkerReportService;
using orchestrator::store::StateStore;
using orchestrator::testing::FakeConnector;
using orchestrator::testing::FakeWorkerAgent;

namespace v1 = orchestrator::v1;

/*
  Orchestrator wired the way the server wires it, minus the RPC transport:
  reports go through the channel and the background dispatcher.
*/
struct Orchestrator {
  std::shared_ptr<StateStore>          store;
  std::shared_ptr<FakeWorkerAgent>     agent     = std::make_shared<FakeWorkerAgent>();
  std::shared_ptr<FakeConnector>       connector = std::make_shared<FakeConnector>();
  std::shared_ptr<ReportChannel>       reports   = std::make_shared<ReportChannel>();
  std::shared_ptr<AgentRegistry>       agents;
  std::shared_ptr<LeaseManager>        leases;
  std::shared_ptr<Scheduler>           scheduler;
  std::shared_ptr<Router>              router;
  std::unique_ptr<ReportDispatcher>    dispatcher;
  std::unique_ptr<AdminService>        admin;
  std::unique_ptr<WorkerReportService> worker_reports;

  explicit Orchestrator(std::shared_ptr<Repository> repository,
                        SchedulerOptions            scheduler_options = {3, 1000ms, 500ms, 1000ms}) {
    store     = std::make_shared<StateStore>(std::move(repository));
    agents    = std::make_shared<AgentRegistry>([this](const std::string&, const std::string&) { return agent; });
    leases    = std::make_shared<LeaseManager>(store, LeaseOptions{100ms, 500ms, 50ms, 0ms}, agents);
    scheduler = std::make_shared<Scheduler>(store, agents, std::make_shared<LeastLoadedPolicy>(), scheduler_options);
    router    = std::make_shared<Router>(store, scheduler, connector, RouterOptions{2000ms, 20ms, 1000ms, 200ms, 100ms});

    dispatcher = std::make_unique<ReportDispatcher>(reports, std::make_shared<ReportHandler>(store, agents));
    dispatcher->Start();

    ServiceContext ctx{store, scheduler, leases, agents, reports};
    admin          = std::make_unique<AdminService>(ctx);
    worker_reports = std::make_unique<WorkerReportService>(ctx);
  }

  ~Orchestrator() {
    dispatcher->Stop();
  }

  uint64_t Register(const std::string& worker_id) {
    v1::RegisterWorkerRequest req;
    req.set_worker_id(worker_id);
    req.set_agent_address("127.0.0.1:9100");
    return worker_reports->RegisterWorker(req).epoch();
  }
};

void TestSessionLifecycle() {
  Orchestrator o(std::make_shared<MemoryRepository>());
  o.Register("worker-a");

  // A client connects before anything runs for the key.
  std::string routed_address;
  std::string routed_id;
  std::thread client([&] {
    auto connection = o.router->Route("session-42");
    routed_address  = connection->Address();
    routed_id       = connection->BackendId();
  });

  std::optional<orchestrator::store::BackendRecord> backend;
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < deadline) {
    backend = o.store->GetByKey("session-42");
    if (backend && backend->state == BackendState::kLoading) break;
    std::this_thread::sleep_for(5ms);
  }
  assert(backend.has_value());
  assert(backend->state == BackendState::kLoading);
  assert(backend->worker_id == "worker-a");

  // The worker finishes loading and reports through the queue.
  v1::ReportReadyRequest ready;
  ready.set_worker_id("worker-a");
  ready.set_backend_id(backend->id);
  ready.set_address("10.0.0.8:7000");
  assert(o.worker_reports->ReportReady(ready).outcome() == v1::REPORT_OUTCOME_APPLIED);

  client.join();
  assert(routed_id == backend->id);
  assert(routed_address == "10.0.0.8:7000");
  assert(o.store->Get(backend->id)->state == BackendState::kReady);

  // An operator terminates the session; the worker is told to drain.
  v1::TerminateBackendRequest terminate;
  terminate.set_backend_id(backend->id);
  assert(o.admin->TerminateBackend(terminate).backend().state() == v1::BACKEND_STATE_DRAINING);
  assert(o.agent->Drains().size() == 1);
  assert(o.agent->Drains()[0] == backend->id);

  bool unavailable = false;
  try {
    o.router->Route("session-42");
  } catch (const orchestrator::util::Unavailable&) {
    unavailable = true;
  }
  assert(unavailable);

  v1::ReportTerminatedRequest terminated;
  terminated.set_worker_id("worker-a");
  terminated.set_backend_id(backend->id);
  assert(o.worker_reports->ReportTerminated(terminated).outcome() == v1::REPORT_OUTCOME_APPLIED);
  assert(o.store->Get(backend->id)->state == BackendState::kTerminated);

  v1::BackendHistoryRequest history;
  history.set_backend_id(backend->id);
  auto entries = o.admin->BackendHistory(history);
  assert(entries.entries_size() == 5);
  assert(entries.entries(4).to_state() == v1::BACKEND_STATE_TERMINATED);

  // The key is free again: the next acquire gets a brand new backend.
  v1::AcquireRequest acquire;
  acquire.set_key("session-42");
  auto next = o.admin->Acquire(acquire);
  assert(next.created());
  assert(next.backend().id() != backend->id);
  assert(o.agent->Placements().size() == 2);
}

void TestWorkerLossReclaimsBackends() {
  Orchestrator o(std::make_shared<MemoryRepository>());
  o.Register("worker-a");

  v1::AcquireRequest acquire;
  acquire.set_key("session");
  const auto id = o.admin->Acquire(acquire).backend().id();

  // No heartbeats: one sweep past the lease reclaims the backend.
  const auto report = o.leases->SweepOnce(orchestrator::util::NowMillis() + 1000);
  assert(report.expired == 1);
  assert(report.workers_lost == 1);
  assert(o.store->Get(id)->state == BackendState::kLost);
  assert(o.store->GetWorker("worker-a")->status == orchestrator::model::WorkerStatus::kLost);
  assert(o.agents->Find("worker-a") == nullptr);

  // A late Ready from the lost session changes nothing.
  orchestrator::agent::WorkerReport late{orchestrator::agent::ReportKind::kReady, "worker-a", id, "10.0.0.8:7000", ""};
  assert(ReportHandler(o.store).Handle(late) != orchestrator::store::ApplyOutcome::kApplied);
  assert(o.store->Get(id)->state == BackendState::kLost);

  // The worker comes back with a new epoch and takes new work.
  assert(o.Register("worker-a") == 2);
  assert(o.agents->Find("worker-a") != nullptr);
  auto next = o.admin->Acquire(acquire);
  assert(next.created());
  assert(next.backend().id() != id);
}

#if ORCHESTRATOR_DB_SQLITE
std::shared_ptr<Repository> OpenSqlite(const std::string& path) {
  auto db = std::make_shared<orchestrator::db::sqlite::SqliteDB>(path);
  db->Bootstrap();
  return std::make_shared<orchestrator::db::sqlite::SqliteRepository>(std::move(db));
}

void TestRestartRecovery() {
  const auto path =
      (std::filesystem::temp_directory_path() / ("orchestrator_e2e_" + std::to_string(orchestrator::util::NowMillis()) + ".db"))
          .string();

  {
    // Fresh file gets every migration; reopening applies none.
    orchestrator::db::sqlite::SqliteDB db(path);
    assert(db.Bootstrap() == 2);
    assert(db.Bootstrap() == 0);
  }

  std::string ready_id;
  std::string stranded_id;
  {
    Orchestrator o(OpenSqlite(path));
    o.Register("worker-a");

    v1::AcquireRequest acquire;
    acquire.set_key("ready-session");
    ready_id = o.admin->Acquire(acquire).backend().id();
    o.store->ApplyEvent(ready_id, orchestrator::model::BackendEvent::kWorkerReportedReady, "worker reported ready",
                        "10.0.0.9:7000");

    // Reserved, but the process dies before the placement outcome is recorded.
    stranded_id = o.store->Reserve("stranded-session", "worker-a", 15000ms, "scheduled").backend.id;
  }

  std::this_thread::sleep_for(20ms);

  {
    Orchestrator o(OpenSqlite(path), SchedulerOptions{3, 10ms, 500ms, 1000ms});
    auto         report = o.scheduler->Recover(orchestrator::util::NowMillis());
    assert(report.checked == 2);
    assert(report.invalid_logs == 0);
    assert(report.failed_placements == 1);

    auto stranded = o.store->Get(stranded_id);
    assert(stranded->state == BackendState::kFailed);
    assert(stranded->cause == "placement outcome lost across restart");

    // The Ready backend survived with its address and is routable again.
    auto ready = o.store->GetByKey("ready-session");
    assert(ready.has_value());
    assert(ready->id == ready_id);
    assert(ready->state == BackendState::kReady);
    assert(o.router->Route("ready-session")->Address() == "10.0.0.9:7000");

    auto history = o.store->History(ready_id);
    assert(history.size() == 3);
    assert(history.back().to_state == BackendState::kReady);
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}
#endif

} // namespace

int main() {
  TestSessionLifecycle();
  TestWorkerLossReclaimsBackends();
#if ORCHESTRATOR_DB_SQLITE
  TestRestartRecovery();
#endif

  std::cout << "orchestrator_integration_end_to_end: pass\n";
  return 0;
}
