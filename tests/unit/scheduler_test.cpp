#include "internal/core/scheduler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/agent/agent_registry.hpp"
#include "internal/core/placement_policy.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;

using orchestrator::agent::AgentRegistry;
using orchestrator::core::LeastLoadedPolicy;
using orchestrator::core::RoundRobinPolicy;
using orchestrator::core::Scheduler;
using orchestrator::core::SchedulerOptions;
using orchestrator::core::WorkerCandidate;
using orchestrator::db::memory::MemoryRepository;
using orchestrator::model::BackendEvent;
using orchestrator::model::BackendState;
using orchestrator::model::WorkerStatus;
using orchestrator::store::StateStore;
using orchestrator::testing::FakeWorkerAgent;

struct Fixture {
  std::shared_ptr<StateStore>    store  = std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
  std::shared_ptr<AgentRegistry> agents = std::make_shared<AgentRegistry>();
  std::shared_ptr<Scheduler>     scheduler;

  explicit Fixture(std::shared_ptr<orchestrator::core::PlacementPolicy> policy = std::make_shared<LeastLoadedPolicy>(),
                   SchedulerOptions options = {3, 1000ms, 15000ms, 1000ms}) {
    scheduler = std::make_shared<Scheduler>(store, agents, std::move(policy), options);
  }

  std::shared_ptr<FakeWorkerAgent> AddWorker(const std::string& id, bool accept = true, uint32_t capacity = 0) {
    store->RegisterWorker(id, "127.0.0.1:0", capacity);
    auto agent = std::make_shared<FakeWorkerAgent>(accept);
    agents->Register(id, agent);
    return agent;
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestAcquireSchedulesAndReusesBackend() {
  Fixture f;
  auto    agent = f.AddWorker("worker-a");

  auto first = f.scheduler->Acquire("session-1");
  assert(first.created);
  assert(first.backend.state == BackendState::kLoading);
  assert(first.backend.worker_id == "worker-a");

  auto placements = agent->Placements();
  assert(placements.size() == 1);
  assert(placements[0].backend_id == first.backend.id);
  assert(placements[0].key == "session-1");
  assert(placements[0].worker_epoch == 1);
  assert(placements[0].lease_duration == 15000ms);

  auto second = f.scheduler->Acquire("session-1");
  assert(!second.created);
  assert(second.backend.id == first.backend.id);
  assert(agent->Placements().size() == 1);

  assert(Throws<std::invalid_argument>([&] { f.scheduler->Acquire(""); }));
}

void TestRejectedPlacementRetriesOnAnotherWorker() {
  Fixture f;
  auto    refusing = f.AddWorker("worker-a", false);
  auto    accepting = f.AddWorker("worker-b", true);

  auto handle = f.scheduler->Acquire("session");
  assert(handle.created);
  assert(handle.backend.worker_id == "worker-b");
  assert(refusing->Placements().size() == 1);
  assert(accepting->Placements().size() == 1);

  // The refused attempt is recorded as its own failed backend.
  auto failed_id = refusing->Placements()[0].backend_id;
  assert(failed_id != handle.backend.id);
  auto failed = f.store->Get(failed_id);
  assert(failed->state == BackendState::kFailed);
  assert(failed->cause.rfind("placement failed: ", 0) == 0);
}

void TestSchedulingFailsWhenEveryWorkerRefuses() {
  Fixture f;
  f.AddWorker("worker-a", false);
  auto unreachable = f.AddWorker("worker-b", true);
  unreachable->SetUnreachable(true);

  assert(Throws<orchestrator::util::SchedulingFailed>([&] { f.scheduler->Acquire("session"); }));
  assert(!f.store->GetByKey("session").has_value());
  for (const auto& backend : f.store->ListBackends()) {
    assert(backend.state == BackendState::kFailed);
  }
}

void TestSchedulingFailsWithoutWorkers() {
  Fixture f;
  assert(Throws<orchestrator::util::SchedulingFailed>([&] { f.scheduler->Acquire("session"); }));

  // Registered but no agent handle.
  f.store->RegisterWorker("worker-a", "127.0.0.1:0", 0);
  assert(Throws<orchestrator::util::SchedulingFailed>([&] { f.scheduler->Acquire("session"); }));
}

void TestDrainedAndFullWorkersAreSkipped() {
  Fixture f;
  f.AddWorker("worker-a", true, 1);
  f.AddWorker("worker-b");

  f.scheduler->DrainWorker("worker-b");
  assert(f.store->GetWorker("worker-b")->status == WorkerStatus::kDraining);

  auto first = f.scheduler->Acquire("k1");
  assert(first.backend.worker_id == "worker-a");

  // worker-a is at capacity and worker-b is draining.
  assert(Throws<orchestrator::util::SchedulingFailed>([&] { f.scheduler->Acquire("k2"); }));
  assert(Throws<orchestrator::util::NotFound>([&] { f.scheduler->DrainWorker("ghost"); }));
}

void TestAcquireOnDrainingKeyIsUnavailable() {
  Fixture f;
  auto    agent = f.AddWorker("worker-a");
  auto    id    = f.scheduler->Acquire("k").backend.id;

  auto terminated = f.scheduler->Terminate(id);
  assert(terminated.state == BackendState::kDraining);
  assert(agent->Drains().size() == 1);
  assert(agent->Drains()[0] == id);

  assert(Throws<orchestrator::util::Unavailable>([&] { f.scheduler->Acquire("k"); }));

  f.store->ApplyEvent(id, BackendEvent::kWorkerReportedTerminated, "gone");
  auto fresh = f.scheduler->Acquire("k");
  assert(fresh.created);
  assert(fresh.backend.id != id);
}

void TestTerminateIsIdempotent() {
  Fixture f;
  auto    agent = f.AddWorker("worker-a");
  auto    id    = f.scheduler->Acquire("k").backend.id;

  f.scheduler->Terminate(id);
  f.scheduler->Terminate(id);
  assert(f.store->Get(id)->state == BackendState::kDraining);

  f.store->ApplyEvent(id, BackendEvent::kWorkerReportedTerminated, "gone");
  auto after = f.scheduler->Terminate(id);
  assert(after.state == BackendState::kTerminated);

  assert(Throws<orchestrator::util::NotFound>([&] { f.scheduler->Terminate("missing"); }));
}

void TestUnreachablePlacementIsDrained() {
  Fixture f;
  auto    unreachable = f.AddWorker("worker-a");
  auto    healthy     = f.AddWorker("worker-b");
  unreachable->SetUnreachable(true);

  auto handle = f.scheduler->Acquire("session");
  assert(handle.backend.worker_id == "worker-b");

  // worker-a may have started the instance before the call failed.
  auto abandoned = unreachable->Placements()[0].backend_id;
  assert(f.store->Get(abandoned)->state == BackendState::kFailed);
  assert(unreachable->Drains().size() == 1);
  assert(unreachable->Drains()[0] == abandoned);

  // A plain refusal started nothing and is not drained.
  assert(healthy->Drains().empty());
  Fixture refused;
  auto    refusing = refused.AddWorker("worker-a", false);
  refused.AddWorker("worker-b");
  refused.scheduler->Acquire("session");
  assert(refusing->Drains().empty());
}

void TestFastReadyReportWinsOverAccept() {
  Fixture f;
  auto    agent = f.AddWorker("worker-a");
  auto    store = f.store;
  agent->OnPlace([store](const orchestrator::agent::PlacementSpec& spec) {
    store->ApplyEvent(spec.backend_id, BackendEvent::kWorkerAcceptedPlacement, "implied by ready report");
    store->ApplyEvent(spec.backend_id, BackendEvent::kWorkerReportedReady, "ready", std::string("10.0.0.9:80"));
  });

  auto handle = f.scheduler->Acquire("k");
  assert(handle.backend.state == BackendState::kReady);
  assert(handle.backend.address == "10.0.0.9:80");
  assert(f.store->History(handle.backend.id).size() == 3);
}

void TestLeastLoadedPolicy() {
  LeastLoadedPolicy policy;
  std::vector<WorkerCandidate> candidates = {{"a", 3, 0}, {"b", 1, 0}, {"c", 1, 0}};
  assert(*policy.SelectWorker(candidates, "k") == "b");
  assert(!policy.SelectWorker({}, "k").has_value());

  Fixture f;
  f.AddWorker("worker-a");
  f.AddWorker("worker-b");
  auto one = f.scheduler->Acquire("k1").backend.worker_id;
  auto two = f.scheduler->Acquire("k2").backend.worker_id;
  assert(one == "worker-a");
  assert(two == "worker-b");
}

void TestRoundRobinPolicy() {
  RoundRobinPolicy             policy;
  std::vector<WorkerCandidate> candidates = {{"a", 0, 0}, {"b", 0, 0}};
  auto first  = *policy.SelectWorker(candidates, "k");
  auto second = *policy.SelectWorker(candidates, "k");
  auto third  = *policy.SelectWorker(candidates, "k");
  assert(first != second);
  assert(first == third);

  assert(orchestrator::core::MakePlacementPolicy("")->Name() == "least_loaded");
  assert(orchestrator::core::MakePlacementPolicy("round_robin")->Name() == "round_robin");
  assert(Throws<std::invalid_argument>([] { orchestrator::core::MakePlacementPolicy("random"); }));
}

void TestRecoverFailsStaleScheduledBackends() {
  Fixture f(std::make_shared<LeastLoadedPolicy>(), SchedulerOptions{3, 1000ms, 15000ms, 1000ms});
  f.store->RegisterWorker("worker-a", "127.0.0.1:0", 0);

  // Reserved by a process that died before the placement outcome was recorded.
  auto stale  = f.store->Reserve("orphan", "worker-a", 15s, "acquire").backend;
  auto loaded = f.store->Reserve("loaded", "worker-a", 15s, "acquire").backend;
  f.store->ApplyEvent(loaded.id, BackendEvent::kWorkerAcceptedPlacement, "accepted");

  auto report = f.scheduler->Recover(stale.created_at_ms + 5000);
  assert(report.checked == 2);
  assert(report.invalid_logs == 0);
  assert(report.failed_placements == 1);
  assert(f.store->Get(stale.id)->state == BackendState::kFailed);
  assert(f.store->Get(stale.id)->cause == "placement outcome lost across restart");
  assert(f.store->Get(loaded.id)->state == BackendState::kLoading);

  // Within the placement window nothing is touched.
  auto fresh = f.store->Reserve("fresh", "worker-a", 15s, "acquire").backend;
  auto quiet = f.scheduler->Recover(fresh.created_at_ms);
  assert(quiet.failed_placements == 0);
  assert(f.store->Get(fresh.id)->state == BackendState::kScheduled);
}

void TestRecoverFlagsLogThatDisagreesWithRecord() {
  Fixture f;
  f.store->RegisterWorker("worker-a", "127.0.0.1:0", 0);
  auto backend = f.store->Reserve("k", "worker-a", 15s, "acquire").backend;

  // A stray entry that does not continue the walk.
  orchestrator::store::TransitionRecord stray;
  stray.backend_id = backend.id;
  stray.from_state = BackendState::kLoading;
  stray.to_state   = BackendState::kReady;
  stray.version    = 7;
  stray.at_ms      = orchestrator::util::NowMillis();
  stray.cause      = "corrupt";
  assert(f.store->AppendLogEntry(stray) > 0);

  auto report = f.scheduler->Recover(backend.created_at_ms);
  assert(report.invalid_logs == 1);
}

} // namespace

int main() {
  TestAcquireSchedulesAndReusesBackend();
  TestRejectedPlacementRetriesOnAnotherWorker();
  TestUnreachablePlacementIsDrained();
  TestSchedulingFailsWhenEveryWorkerRefuses();
  TestSchedulingFailsWithoutWorkers();
  TestDrainedAndFullWorkersAreSkipped();
  TestAcquireOnDrainingKeyIsUnavailable();
  TestTerminateIsIdempotent();
  TestFastReadyReportWinsOverAccept();
  TestLeastLoadedPolicy();
  TestRoundRobinPolicy();
  TestRecoverFailsStaleScheduledBackends();
  TestRecoverFlagsLogThatDisagreesWithRecord();

  std::cout << "orchestrator_unit_scheduler: pass\n";
  return 0;
}
