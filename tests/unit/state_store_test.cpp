#include "internal/store/state_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace std::chrono_literals;

using orchestrator::db::memory::MemoryRepository;
using orchestrator::model::BackendEvent;
using orchestrator::model::BackendState;
using orchestrator::model::WorkerStatus;
using orchestrator::store::ApplyOutcome;
using orchestrator::store::StateChange;
using orchestrator::store::StateStore;

std::shared_ptr<StateStore> MakeStore() {
  auto store = std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
  store->RegisterWorker("worker-a", "127.0.0.1:9001", 0);
  return store;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestReserveCreatesScheduledBackendWithLease() {
  auto store = MakeStore();

  auto reserved = store->Reserve("session-1", "worker-a", 15s, "acquire");
  assert(reserved.reserved);
  assert(reserved.worker_epoch == 1);
  assert(reserved.backend.state == BackendState::kScheduled);
  assert(reserved.backend.version == 1);
  assert(reserved.backend.worker_id == "worker-a");
  assert(orchestrator::util::IsCanonicalId(reserved.backend.id));
  assert(!orchestrator::util::IsCanonicalId("session-1"));

  auto lease = store->GetLease(reserved.backend.id);
  assert(lease.has_value());
  assert(lease->active);
  assert(lease->worker_epoch == 1);

  auto history = store->History(reserved.backend.id);
  assert(history.size() == 1);
  assert(history[0].from_state == BackendState::kUnspecified);
  assert(history[0].to_state == BackendState::kScheduled);
  assert(history[0].version == 1);

  // Second reserve for the same key returns the holder.
  auto again = store->Reserve("session-1", "worker-a", 15s, "acquire");
  assert(!again.reserved);
  assert(again.backend.id == reserved.backend.id);

  assert(Throws<orchestrator::util::NotFound>([&] { store->Reserve("session-2", "ghost", 15s, "acquire"); }));
  assert(Throws<std::invalid_argument>([&] { store->Reserve("", "worker-a", 15s, "acquire"); }));
}

void TestCompareAndTransition() {
  auto store = MakeStore();
  auto id    = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;

  auto version = store->CompareAndTransition(id, 1, BackendState::kLoading, "accepted");
  assert(version == 2);

  assert(Throws<orchestrator::util::VersionMismatch>(
      [&] { store->CompareAndTransition(id, 1, BackendState::kReady, "ready"); }));
  assert(Throws<orchestrator::util::InvalidTransition>(
      [&] { store->CompareAndTransition(id, 2, BackendState::kTerminated, "skip"); }));
  assert(Throws<orchestrator::util::NotFound>(
      [&] { store->CompareAndTransition("missing", 1, BackendState::kLoading, "x"); }));

  version = store->CompareAndTransition(id, 2, BackendState::kReady, "ready", std::string("10.0.0.5:8080"));
  assert(version == 3);
  auto backend = store->Get(id);
  assert(backend->state == BackendState::kReady);
  assert(backend->address == "10.0.0.5:8080");
  assert(backend->cause == "ready");
}

void TestApplyEventOutcomes() {
  auto store = MakeStore();
  auto id    = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;

  auto applied = store->ApplyEvent(id, BackendEvent::kWorkerAcceptedPlacement, "accepted");
  assert(applied.outcome == ApplyOutcome::kApplied);
  assert(applied.backend.state == BackendState::kLoading);
  assert(applied.backend.version == 2);

  auto dup = store->ApplyEvent(id, BackendEvent::kWorkerAcceptedPlacement, "accepted again");
  assert(dup.outcome == ApplyOutcome::kNoOp);
  assert(dup.backend.version == 2);

  auto rejected = store->ApplyEvent(id, BackendEvent::kExplicitTerminate, "too early");
  assert(rejected.outcome == ApplyOutcome::kRejected);
  assert(store->Get(id)->version == 2);

  store->ApplyEvent(id, BackendEvent::kWorkerReportedReady, "ready", std::string("10.0.0.1:1"));
  // A duplicate Ready keeps the first address.
  store->ApplyEvent(id, BackendEvent::kWorkerReportedReady, "ready", std::string("10.0.0.2:2"));
  assert(store->Get(id)->address == "10.0.0.1:1");

  assert(Throws<orchestrator::util::NotFound>(
      [&] { store->ApplyEvent("missing", BackendEvent::kDrainRequested, "x"); }));
}

void TestTerminalFreesKeyAndRetiresLease() {
  auto store = MakeStore();
  auto first = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;
  store->ApplyEvent(first, BackendEvent::kWorkerReportedHealthFailure, "crashed");

  assert(store->Get(first)->state == BackendState::kFailed);
  assert(!store->GetByKey("k").has_value());
  assert(!store->GetLease(first)->active);

  auto second = store->Reserve("k", "worker-a", 15s, "acquire");
  assert(second.reserved);
  assert(second.backend.id != first);
  assert(store->ListLive().size() == 1);
  assert(store->ListBackends().size() == 2);
  assert(store->ListByWorker("worker-a").size() == 2);
}

void TestHistoryIsContiguous() {
  auto store = MakeStore();
  auto id    = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;
  store->ApplyEvent(id, BackendEvent::kWorkerAcceptedPlacement, "accepted");
  store->ApplyEvent(id, BackendEvent::kWorkerReportedReady, "ready", std::string("h:1"));
  store->ApplyEvent(id, BackendEvent::kDrainRequested, "terminate");
  store->ApplyEvent(id, BackendEvent::kWorkerReportedTerminated, "gone");

  auto history = store->History(id);
  assert(history.size() == 5);
  for (size_t i = 0; i < history.size(); ++i) {
    assert(history[i].version == i + 1);
    if (i > 0) {
      assert(history[i].from_state == history[i - 1].to_state);
      assert(history[i].sequence > history[i - 1].sequence);
      assert(history[i].at_ms >= history[i - 1].at_ms);
    }
  }
  assert(history.back().to_state == BackendState::kTerminated);
  assert(history.back().cause == "gone");

  assert(Throws<orchestrator::util::NotFound>([&] { store->History("missing"); }));
}

void TestWorkerEpochsAndHeartbeats() {
  auto store  = std::make_shared<StateStore>(std::make_shared<MemoryRepository>());
  auto worker = store->RegisterWorker("w", "127.0.0.1:9001", 4);
  assert(worker.epoch == 1);
  assert(worker.status == WorkerStatus::kActive);
  assert(worker.capacity_hint == 4);

  auto id = store->Reserve("k", "w", 1s, "acquire").backend.id;
  const auto before = store->GetLease(id)->expires_at_ms;

  assert(store->Heartbeat("w", 1, 60s) == 1);
  assert(store->GetLease(id)->expires_at_ms > before);

  // Re-registration bumps the epoch; the old session is fenced off and its
  // lease is no longer renewed by the new epoch.
  auto again = store->RegisterWorker("w", "127.0.0.1:9002", 4);
  assert(again.epoch == 2);
  assert(again.address == "127.0.0.1:9002");
  assert(Throws<orchestrator::util::StaleEpoch>([&] { store->Heartbeat("w", 1, 60s); }));
  assert(store->Heartbeat("w", 2, 60s) == 0);

  store->SetWorkerStatus("w", WorkerStatus::kLost);
  assert(Throws<orchestrator::util::StaleEpoch>([&] { store->Heartbeat("w", 2, 60s); }));
  assert(Throws<orchestrator::util::NotFound>([&] { store->Heartbeat("ghost", 1, 60s); }));
  assert(Throws<std::invalid_argument>([&] { store->RegisterWorker("", "a", 0); }));

  auto back = store->RegisterWorker("w", "127.0.0.1:9002", 4);
  assert(back.status == WorkerStatus::kActive);
  assert(back.epoch == 3);
}

void TestExpireLeaseRechecksInTransaction() {
  auto store = MakeStore();
  auto id    = store->Reserve("k", "worker-a", 1000ms, "acquire").backend.id;
  const auto expires = store->GetLease(id)->expires_at_ms;

  // Not yet expired at this instant.
  auto early = store->ExpireLease(id, expires - 1);
  assert(early.outcome == ApplyOutcome::kNoOp);
  assert(store->Get(id)->state == BackendState::kScheduled);

  assert(store->ExpiredLeases(expires).size() == 1);
  auto expired = store->ExpireLease(id, expires);
  assert(expired.outcome == ApplyOutcome::kApplied);
  assert(expired.backend.state == BackendState::kLost);
  assert(store->Get(id)->cause == "lease expired");
  assert(store->ExpiredLeases(expires + 1).empty());
}

void TestMarkWorkerLostRereadsHeartbeat() {
  auto       store        = MakeStore();
  const auto heartbeat_at = store->GetWorker("worker-a")->last_heartbeat_at_ms;

  // Heard from within the window.
  assert(!store->MarkWorkerLostIfSilent("worker-a", heartbeat_at + 1000, 1000ms).has_value());
  assert(store->GetWorker("worker-a")->status == WorkerStatus::kActive);

  auto lost = store->MarkWorkerLostIfSilent("worker-a", heartbeat_at + 1001, 1000ms);
  assert(lost.has_value());
  assert(lost->status == WorkerStatus::kActive);
  assert(lost->last_heartbeat_at_ms == heartbeat_at);
  assert(store->GetWorker("worker-a")->status == WorkerStatus::kLost);

  // Already Lost, or unknown.
  assert(!store->MarkWorkerLostIfSilent("worker-a", heartbeat_at + 5000, 1000ms).has_value());
  assert(!store->MarkWorkerLostIfSilent("ghost", heartbeat_at + 5000, 1000ms).has_value());
}

void TestRenewAndInvalidateLeases() {
  auto store = MakeStore();
  auto one   = store->Reserve("k1", "worker-a", 1000ms, "acquire").backend.id;
  auto two   = store->Reserve("k2", "worker-a", 1000ms, "acquire").backend.id;

  const auto until = store->GetLease(one)->expires_at_ms + 60'000;
  assert(store->RenewLeases("worker-a", 1, until) == 2);
  assert(store->GetLease(one)->expires_at_ms == until);
  assert(store->GetLease(two)->expires_at_ms == until);

  // Other epochs and earlier deadlines renew nothing.
  assert(store->RenewLeases("worker-a", 2, until + 1) == 0);
  assert(store->RenewLeases("worker-a", 1, until - 10) == 2);
  assert(store->GetLease(one)->expires_at_ms == until);

  assert(store->InvalidateLease(one));
  assert(!store->InvalidateLease(one));
  assert(!store->InvalidateLease("missing"));
  assert(!store->GetLease(one)->active);

  // An inactive lease is neither renewed nor swept.
  assert(store->RenewLeases("worker-a", 1, until + 5) == 1);
  auto expired = store->ExpiredLeases(until + 10);
  assert(expired.size() == 1);
  assert(expired[0].backend_id == two);
}

void TestListenersSeeEveryAppliedTransition() {
  auto                     store = MakeStore();
  std::vector<StateChange> seen;
  auto sub = store->Subscribe([&seen](const StateChange& change) { seen.push_back(change); });

  auto id = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;
  store->ApplyEvent(id, BackendEvent::kWorkerAcceptedPlacement, "accepted");
  store->ApplyEvent(id, BackendEvent::kWorkerAcceptedPlacement, "noop");
  store->ApplyEvent(id, BackendEvent::kExplicitTerminate, "rejected");

  assert(seen.size() == 2);
  assert(seen[0].from == BackendState::kUnspecified);
  assert(seen[0].to == BackendState::kScheduled);
  assert(seen[1].to == BackendState::kLoading);
  assert(seen[1].version == 2);
  assert(seen[1].key == "k");

  store->Unsubscribe(sub);
  store->ApplyEvent(id, BackendEvent::kDrainRequested, "drain");
  assert(seen.size() == 2);
}

void TestConcurrentReserveHasOneWinner() {
  auto store = MakeStore();

  std::atomic<int>         winners{0};
  std::vector<std::string> ids(8);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      auto result = store->Reserve("contended", "worker-a", 15s, "acquire");
      if (result.reserved) ++winners;
      ids[i] = result.backend.id;
    });
  }
  for (auto& t : threads) t.join();

  assert(winners == 1);
  for (const auto& id : ids) {
    assert(id == ids[0]);
  }
}

void TestConcurrentApplyEventsAppliesEachOnce() {
  auto store = MakeStore();
  auto id    = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;

  std::atomic<int>         applied{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&] {
      auto result = store->ApplyEvent(id, BackendEvent::kWorkerAcceptedPlacement, "accepted");
      if (result.outcome == ApplyOutcome::kApplied) ++applied;
    });
  }
  for (auto& t : threads) t.join();

  assert(applied == 1);
  assert(store->Get(id)->version == 2);
  assert(store->History(id).size() == 2);
}

void TestPurgeTerminal() {
  auto store = MakeStore();
  auto id    = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;
  store->ApplyEvent(id, BackendEvent::kWorkerReportedHealthFailure, "failed");
  auto live = store->Reserve("k", "worker-a", 15s, "acquire").backend.id;

  const auto changed_at = store->Get(id)->last_state_change_at_ms;
  assert(store->PurgeTerminal(changed_at) == 0);
  assert(store->PurgeTerminal(changed_at + 1) == 1);
  assert(!store->Get(id).has_value());
  assert(store->Get(live).has_value());
}

} // namespace

int main() {
  TestReserveCreatesScheduledBackendWithLease();
  TestCompareAndTransition();
  TestApplyEventOutcomes();
  TestTerminalFreesKeyAndRetiresLease();
  TestHistoryIsContiguous();
  TestWorkerEpochsAndHeartbeats();
  TestExpireLeaseRechecksInTransaction();
  TestMarkWorkerLostRereadsHeartbeat();
  TestRenewAndInvalidateLeases();
  TestListenersSeeEveryAppliedTransition();
  TestConcurrentReserveHasOneWinner();
  TestConcurrentApplyEventsAppliesEachOnce();
  TestPurgeTerminal();

  std::cout << "orchestrator_unit_state_store: pass\n";
  return 0;
}
