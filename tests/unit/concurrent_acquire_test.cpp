#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/agent/agent_registry.hpp"
#include "internal/core/placement_policy.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;

using orchestrator::agent::AgentRegistry;
using orchestrator::core::LeastLoadedPolicy;
using orchestrator::core::Scheduler;
using orchestrator::core::SchedulerOptions;
using orchestrator::db::memory::MemoryRepository;
using orchestrator::model::BackendState;
using orchestrator::store::StateStore;
using orchestrator::testing::FakeWorkerAgent;

struct Cluster {
  std::shared_ptr<StateStore>                   store  = std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
  std::shared_ptr<AgentRegistry>                agents = std::make_shared<AgentRegistry>();
  std::vector<std::shared_ptr<FakeWorkerAgent>> workers;
  std::shared_ptr<Scheduler>                    scheduler;

  explicit Cluster(int worker_count) {
    for (int i = 0; i < worker_count; ++i) {
      const auto id = "worker-" + std::to_string(i);
      store->RegisterWorker(id, "127.0.0.1:0", 0);
      auto agent = std::make_shared<FakeWorkerAgent>();
      // Widen the window between reservation and placement outcome.
      agent->OnPlace([](const orchestrator::agent::PlacementSpec&) { std::this_thread::sleep_for(5ms); });
      agents->Register(id, agent);
      workers.push_back(agent);
    }
    scheduler = std::make_shared<Scheduler>(store, agents, std::make_shared<LeastLoadedPolicy>(),
                                            SchedulerOptions{3, 1000ms, 15000ms, 1000ms});
  }

  size_t TotalPlacements() const {
    size_t total = 0;
    for (const auto& worker : workers) {
      total += worker->Placements().size();
    }
    return total;
  }
};

void TestSameKeyConvergesOnOneBackend() {
  Cluster cluster(3);

  constexpr int            kCallers = 16;
  std::vector<std::string> ids(kCallers);
  std::atomic<int>         created{0};
  std::atomic<bool>        go{false};

  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; ++i) {
    threads.emplace_back([&, i] {
      while (!go) {
        std::this_thread::yield();
      }
      auto handle = cluster.scheduler->Acquire("hot-session");
      if (handle.created) ++created;
      ids[i] = handle.backend.id;
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  assert(created == 1);
  for (const auto& id : ids) {
    assert(id == ids[0]);
  }
  assert(cluster.TotalPlacements() == 1);
  assert(cluster.store->ListLive().size() == 1);
  assert(cluster.store->ListBackends().size() == 1);
}

void TestDistinctKeysSpreadAcrossWorkers() {
  Cluster cluster(4);

  constexpr int            kKeys = 12;
  std::vector<std::thread> threads;
  for (int i = 0; i < kKeys; ++i) {
    threads.emplace_back([&, i] { cluster.scheduler->Acquire("session-" + std::to_string(i)); });
  }
  for (auto& t : threads) t.join();

  auto live = cluster.store->ListLive();
  assert(live.size() == kKeys);

  std::set<std::string> keys;
  std::set<std::string> used_workers;
  for (const auto& backend : live) {
    keys.insert(backend.key);
    used_workers.insert(backend.worker_id);
    assert(backend.state == BackendState::kLoading);
  }
  assert(keys.size() == kKeys);
  assert(used_workers.size() > 1);
  assert(cluster.TotalPlacements() == kKeys);
}

void TestReacquireAfterTerminalRace() {
  Cluster cluster(2);
  auto    first = cluster.scheduler->Acquire("k").backend;
  cluster.store->ApplyEvent(first.id, orchestrator::model::BackendEvent::kLeaseExpired, "lease expired");

  std::vector<std::string> ids(8);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] { ids[i] = cluster.scheduler->Acquire("k").backend.id; });
  }
  for (auto& t : threads) t.join();

  for (const auto& id : ids) {
    assert(id == ids[0]);
    assert(id != first.id);
  }
  assert(cluster.store->ListLive().size() == 1);
}

} // namespace

int main() {
  TestSameKeyConvergesOnOneBackend();
  TestDistinctKeysSpreadAcrossWorkers();
  TestReacquireAfterTerminalRace();

  std::cout << "orchestrator_unit_concurrent_acquire: pass\n";
  return 0;
}
