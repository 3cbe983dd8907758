#include "internal/agent/report_handler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/agent/agent_registry.hpp"
#include "internal/agent/report_channel.hpp"
#include "internal/agent/report_dispatcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;

using orchestrator::agent::AgentRegistry;
using orchestrator::agent::DispatcherOptions;
using orchestrator::agent::ReportChannel;
using orchestrator::agent::ReportDispatcher;
using orchestrator::agent::ReportHandler;
using orchestrator::agent::ReportKind;
using orchestrator::agent::WorkerReport;
using orchestrator::db::memory::MemoryRepository;
using orchestrator::model::BackendEvent;
using orchestrator::model::BackendState;
using orchestrator::store::ApplyOutcome;
using orchestrator::store::StateStore;
using orchestrator::store::StoreOptions;
using orchestrator::testing::FakeWorkerAgent;
using orchestrator::testing::ScriptedRepository;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

struct Fixture {
  std::shared_ptr<StateStore>    store   = std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
  std::shared_ptr<ReportHandler> handler = std::make_shared<ReportHandler>(store);
  std::string                    backend_id;

  Fixture() {
    store->RegisterWorker("worker-a", "127.0.0.1:9001", 0);
    store->RegisterWorker("worker-b", "127.0.0.1:9002", 0);
    backend_id = store->Reserve("session", "worker-a", 15s, "acquire").backend.id;
  }

  WorkerReport Report(ReportKind kind, const std::string& worker = "worker-a") const {
    WorkerReport report;
    report.kind       = kind;
    report.worker_id  = worker;
    report.backend_id = backend_id;
    return report;
  }
};

void TestReadyMovesLoadingToReady() {
  Fixture f;
  f.store->ApplyEvent(f.backend_id, BackendEvent::kWorkerAcceptedPlacement, "accepted");

  auto ready    = f.Report(ReportKind::kReady);
  ready.address = "10.1.0.7:8080";
  assert(f.handler->Handle(ready) == ApplyOutcome::kApplied);

  auto backend = f.store->Get(f.backend_id);
  assert(backend->state == BackendState::kReady);
  assert(backend->address == "10.1.0.7:8080");

  // Re-delivery is a NoOp and keeps the address.
  ready.address = "10.1.0.8:8080";
  assert(f.handler->Handle(ready) == ApplyOutcome::kNoOp);
  assert(f.store->Get(f.backend_id)->address == "10.1.0.7:8080");
}

void TestReadyAheadOfAcceptImpliesAccept() {
  Fixture f;

  auto ready    = f.Report(ReportKind::kReady);
  ready.address = "10.1.0.7:8080";
  assert(f.handler->Handle(ready) == ApplyOutcome::kApplied);

  auto history = f.store->History(f.backend_id);
  assert(history.size() == 3);
  assert(history[1].to_state == BackendState::kLoading);
  assert(history[2].to_state == BackendState::kReady);
}

void TestHealthFailure() {
  Fixture f;
  auto    failure = f.Report(ReportKind::kHealthFailure);
  failure.reason  = "oom";
  assert(f.handler->Handle(failure) == ApplyOutcome::kApplied);

  auto backend = f.store->Get(f.backend_id);
  assert(backend->state == BackendState::kFailed);
  assert(backend->cause == "health failure: oom");
}

void TestHealthFailureOnReadyDrains() {
  Fixture f;
  f.store->ApplyEvent(f.backend_id, BackendEvent::kWorkerAcceptedPlacement, "accepted");
  f.store->ApplyEvent(f.backend_id, BackendEvent::kWorkerReportedReady, "ready", std::string("h:1"));

  assert(f.handler->Handle(f.Report(ReportKind::kHealthFailure)) == ApplyOutcome::kApplied);
  assert(f.store->Get(f.backend_id)->state == BackendState::kDraining);
}

void TestTerminatedOnReadyImpliesDrain() {
  Fixture f;
  f.store->ApplyEvent(f.backend_id, BackendEvent::kWorkerAcceptedPlacement, "accepted");
  f.store->ApplyEvent(f.backend_id, BackendEvent::kWorkerReportedReady, "ready", std::string("h:1"));

  assert(f.handler->Handle(f.Report(ReportKind::kTerminated)) == ApplyOutcome::kApplied);
  auto history = f.store->History(f.backend_id);
  assert(history.back().to_state == BackendState::kTerminated);
  assert(history[history.size() - 2].to_state == BackendState::kDraining);

  assert(f.handler->Handle(f.Report(ReportKind::kTerminated)) == ApplyOutcome::kNoOp);
}

void TestReportsFromOtherWorkersAreDropped() {
  Fixture f;
  assert(f.handler->Handle(f.Report(ReportKind::kHealthFailure, "worker-b")) == ApplyOutcome::kRejected);
  assert(f.store->Get(f.backend_id)->state == BackendState::kScheduled);

  WorkerReport unknown;
  unknown.kind       = ReportKind::kTerminated;
  unknown.worker_id  = "worker-a";
  unknown.backend_id = "no-such-backend";
  assert(f.handler->Handle(unknown) == ApplyOutcome::kRejected);
}

void TestReadyForGivenUpBackendDrainsIt() {
  Fixture f;
  auto    agents = std::make_shared<AgentRegistry>();
  auto    agent  = std::make_shared<FakeWorkerAgent>();
  agents->Register("worker-a", agent);
  ReportHandler handler(f.store, agents, 100ms);

  // The placement call timed out and the attempt was failed, but the
  // worker started the instance anyway.
  f.store->ApplyEvent(f.backend_id, BackendEvent::kWorkerReportedHealthFailure, "placement failed: timeout");

  auto ready    = f.Report(ReportKind::kReady);
  ready.address = "10.1.0.7:8080";
  assert(handler.Handle(ready) == ApplyOutcome::kRejected);
  assert(f.store->Get(f.backend_id)->state == BackendState::kFailed);
  assert(agent->Drains().size() == 1);
  assert(agent->Drains()[0] == f.backend_id);

  // A live backend is not drained by its own Ready.
  auto live = f.store->Reserve("other", "worker-a", 15s, "acquire").backend;
  ready.backend_id = live.id;
  assert(handler.Handle(ready) == ApplyOutcome::kApplied);
  assert(agent->Drains().size() == 1);
}

void TestChannelShutdownDrainsQueue() {
  ReportChannel channel;
  auto          first  = channel.Submit(WorkerReport{});
  auto          second = channel.Submit(WorkerReport{});
  assert(first.has_value() && second.has_value());
  assert(channel.Size() == 2);

  channel.Shutdown();
  assert(!channel.Submit(WorkerReport{}).has_value());
  assert(channel.Dequeue().has_value());

  // Requeued reports are still handed out after shutdown.
  auto pending = channel.Dequeue();
  assert(pending.has_value());
  channel.Requeue(std::move(*pending));
  assert(channel.Dequeue().has_value());
  assert(!channel.Dequeue().has_value());
}

void TestDispatcherAnswersAfterCommit() {
  Fixture f;
  auto    channel = std::make_shared<ReportChannel>();

  ReportDispatcher dispatcher(channel, f.handler);
  dispatcher.Start();

  auto ready    = f.Report(ReportKind::kReady);
  ready.address = "10.1.0.7:8080";
  auto first    = channel->Submit(ready);
  auto second   = channel->Submit(ready);

  assert(first->get() == ApplyOutcome::kApplied);
  assert(f.store->Get(f.backend_id)->state == BackendState::kReady);
  assert(second->get() == ApplyOutcome::kNoOp);

  dispatcher.Stop();
  assert(f.store->History(f.backend_id).size() == 3);
}

void TestTransientStoreFailureIsRetried() {
  auto repository = std::make_shared<ScriptedRepository>();
  auto store      = std::make_shared<StateStore>(repository, StoreOptions{1, 1ms, 1ms});
  store->RegisterWorker("worker-a", "127.0.0.1:9001", 0);
  auto id = store->Reserve("session", "worker-a", 15s, "acquire").backend.id;

  auto             channel = std::make_shared<ReportChannel>();
  ReportDispatcher dispatcher(channel, std::make_shared<ReportHandler>(store), DispatcherOptions{3, 1ms});
  dispatcher.Start();

  WorkerReport ready;
  ready.kind       = ReportKind::kReady;
  ready.worker_id  = "worker-a";
  ready.backend_id = id;
  ready.address    = "10.1.0.7:8080";

  // Two failed attempts, then the third commits before the answer.
  repository->FailNextBegins(2);
  assert(channel->Submit(ready)->get() == ApplyOutcome::kApplied);
  assert(store->Get(id)->state == BackendState::kReady);

  dispatcher.Stop();
}

void TestExhaustedRetriesFailTheSubmitter() {
  auto repository = std::make_shared<ScriptedRepository>();
  auto store      = std::make_shared<StateStore>(repository, StoreOptions{1, 1ms, 1ms});
  store->RegisterWorker("worker-a", "127.0.0.1:9001", 0);
  auto id = store->Reserve("session", "worker-a", 15s, "acquire").backend.id;

  auto             channel = std::make_shared<ReportChannel>();
  ReportDispatcher dispatcher(channel, std::make_shared<ReportHandler>(store), DispatcherOptions{3, 1ms});
  dispatcher.Start();

  WorkerReport failure;
  failure.kind       = ReportKind::kHealthFailure;
  failure.worker_id  = "worker-a";
  failure.backend_id = id;
  failure.reason     = "oom";

  repository->FailNextBegins(3);
  auto lost = channel->Submit(failure);
  assert(Throws<orchestrator::util::Unavailable>([&] { lost->get(); }));
  assert(store->Get(id)->state == BackendState::kScheduled);

  // The worker resends and the report lands.
  assert(channel->Submit(failure)->get() == ApplyOutcome::kApplied);
  assert(store->Get(id)->state == BackendState::kFailed);

  dispatcher.Stop();
}

} // namespace

int main() {
  TestReadyMovesLoadingToReady();
  TestReadyAheadOfAcceptImpliesAccept();
  TestHealthFailure();
  TestHealthFailureOnReadyDrains();
  TestTerminatedOnReadyImpliesDrain();
  TestReportsFromOtherWorkersAreDropped();
  TestReadyForGivenUpBackendDrainsIt();
  TestChannelShutdownDrainsQueue();
  TestDispatcherAnswersAfterCommit();
  TestTransientStoreFailureIsRetried();
  TestExhaustedRetriesFailTheSubmitter();

  std::cout << "orchestrator_unit_report_handler: pass\n";
  return 0;
}
