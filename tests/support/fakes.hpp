#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/agent/worker_agent.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/router/connector.hpp"
#include "internal/util/errors.hpp"

namespace orchestrator::testing {

/*
  Scripted worker agent. Accepts placements unless told otherwise and
  records every command it receives.
*/
class FakeWorkerAgent : public agent::WorkerAgent {
 public:
  using PlaceHook = std::function<void(const agent::PlacementSpec&)>;

  explicit FakeWorkerAgent(bool accept = true) : accept_(accept) {
  }

  agent::PlacementReply PlaceBackend(const agent::PlacementSpec& spec, std::chrono::milliseconds) override {
    PlaceHook hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      placements_.push_back(spec);
      hook = on_place_;
    }
    if (unreachable_) {
      throw util::PlacementFailed("agent unreachable");
    }
    if (hook) {
      hook(spec);
    }
    return agent::PlacementReply{accept_.load(), accept_ ? "" : "out of capacity"};
  }

  void DrainBackend(const std::string& backend_id, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    drains_.push_back(backend_id);
  }

  void SetAccept(bool accept) {
    accept_ = accept;
  }
  void SetUnreachable(bool unreachable) {
    unreachable_ = unreachable;
  }
  // Runs inside PlaceBackend before the reply is returned.
  void OnPlace(PlaceHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_place_ = std::move(hook);
  }

  std::vector<agent::PlacementSpec> Placements() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return placements_;
  }
  std::vector<std::string> Drains() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drains_;
  }

 private:
  std::atomic<bool>                 accept_;
  std::atomic<bool>                 unreachable_{false};
  mutable std::mutex                mutex_;
  PlaceHook                         on_place_;
  std::vector<agent::PlacementSpec> placements_;
  std::vector<std::string>          drains_;
};

class FakeConnection : public router::Connection {
 public:
  int Fd() const override {
    return -1;
  }
  void Close() override {
    closed_ = true;
  }
  bool Closed() const override {
    return closed_;
  }

 private:
  std::atomic<bool> closed_{false};
};

// Hands out descriptor-less connections; addresses can be made unreachable.
class FakeConnector : public router::Connector {
 public:
  std::unique_ptr<router::Connection> Dial(const std::string& address, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex_);
    dialed_.push_back(address);
    if (unreachable_.contains(address)) {
      throw util::Unavailable("connection refused: " + address);
    }
    return std::make_unique<FakeConnection>();
  }

  void MakeUnreachable(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_.insert(address);
  }

  std::vector<std::string> Dialed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dialed_;
  }

 private:
  mutable std::mutex              mutex_;
  std::unordered_set<std::string> unreachable_;
  std::vector<std::string>        dialed_;
};

/*
  Memory repository with scripted misbehaviour: Begin() can fail with a
  transient error the way a busy SQLite file or a Postgres serialization
  failure surfaces, and ListWorkers() can return an old snapshot.
*/
class ScriptedRepository : public db::Repository {
 public:
  // The next n transactions fail to begin.
  void FailNextBegins(int n) {
    failures_ = n;
  }

  // ListWorkers returns `workers` from now on.
  void PinWorkerList(std::vector<db::model::WorkerRecord> workers) {
    std::lock_guard<std::mutex> lock(mutex_);
    pinned_workers_ = std::move(workers);
  }

  std::unique_ptr<db::Transaction> Begin() override {
    if (failures_.fetch_sub(1) > 0) {
      throw db::TransientError("database is locked");
    }
    failures_ = 0;
    return inner_.Begin();
  }

  db::Result InsertBackend(db::Transaction& tx, const db::model::BackendRecord& r) override {
    return inner_.InsertBackend(tx, r);
  }
  std::optional<db::model::BackendRecord> GetBackend(db::Transaction& tx, const std::string& id) override {
    return inner_.GetBackend(tx, id);
  }
  std::optional<db::model::BackendRecord> GetLiveBackendByKey(db::Transaction& tx, const std::string& key) override {
    return inner_.GetLiveBackendByKey(tx, key);
  }
  std::vector<db::model::BackendRecord> ListBackends(db::Transaction& tx) override {
    return inner_.ListBackends(tx);
  }
  std::vector<db::model::BackendRecord> ListLiveBackends(db::Transaction& tx) override {
    return inner_.ListLiveBackends(tx);
  }
  std::vector<db::model::BackendRecord> ListBackendsByWorker(db::Transaction& tx, const std::string& worker_id) override {
    return inner_.ListBackendsByWorker(tx, worker_id);
  }
  db::Result UpdateBackendIfVersion(db::Transaction& tx, const db::model::BackendRecord& r, uint64_t expected) override {
    return inner_.UpdateBackendIfVersion(tx, r, expected);
  }
  db::Result PurgeTerminalBackends(db::Transaction& tx, uint64_t cutoff_ms, uint64_t& purged) override {
    return inner_.PurgeTerminalBackends(tx, cutoff_ms, purged);
  }
  db::Result UpsertWorker(db::Transaction& tx, const db::model::WorkerRecord& r) override {
    return inner_.UpsertWorker(tx, r);
  }
  std::optional<db::model::WorkerRecord> GetWorker(db::Transaction& tx, const std::string& id) override {
    return inner_.GetWorker(tx, id);
  }
  std::vector<db::model::WorkerRecord> ListWorkers(db::Transaction& tx) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (pinned_workers_) return *pinned_workers_;
    }
    return inner_.ListWorkers(tx);
  }
  db::Result UpsertLease(db::Transaction& tx, const db::model::LeaseRecord& r) override {
    return inner_.UpsertLease(tx, r);
  }
  std::optional<db::model::LeaseRecord> GetLease(db::Transaction& tx, const std::string& backend_id) override {
    return inner_.GetLease(tx, backend_id);
  }
  db::Result RenewLeases(db::Transaction& tx, const std::string& worker_id, uint64_t epoch, uint64_t expires_at_ms,
                         uint64_t& renewed) override {
    return inner_.RenewLeases(tx, worker_id, epoch, expires_at_ms, renewed);
  }
  std::vector<db::model::LeaseRecord> ListExpiredLeases(db::Transaction& tx, uint64_t now_ms) override {
    return inner_.ListExpiredLeases(tx, now_ms);
  }
  db::Result AppendTransition(db::Transaction& tx, db::model::TransitionRecord& r) override {
    return inner_.AppendTransition(tx, r);
  }
  std::vector<db::model::TransitionRecord> GetTransitions(db::Transaction& tx, const std::string& backend_id) override {
    return inner_.GetTransitions(tx, backend_id);
  }

 private:
  db::memory::MemoryRepository inner_;
  std::atomic<int>             failures_{0};

  std::mutex                                          mutex_;
  std::optional<std::vector<db::model::WorkerRecord>> pinned_workers_;
};

} // namespace orchestrator::testing
