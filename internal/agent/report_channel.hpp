#pragma once

#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

#include "internal/store/state_store.hpp"

namespace orchestrator::agent {

enum class ReportKind {
  kReady,
  kHealthFailure,
  kTerminated,
};

// One worker -> orchestrator lifecycle report. Delivery is at-least-once.
struct WorkerReport {
  ReportKind  kind = ReportKind::kReady;
  std::string worker_id;
  std::string backend_id;
  // kReady only
  std::string address;
  // kHealthFailure only
  std::string reason;
};

// A queued report and the promise the submitting RPC waits on. The promise
// is fulfilled only after the report's transition committed, or failed with
// the error that stopped it.
struct PendingReport {
  WorkerReport                      report;
  std::promise<store::ApplyOutcome> applied;
  uint32_t                          attempts = 0;
};

/*
  Thread-safe blocking queue between the report RPCs and the dispatcher.
*/
class ReportChannel {
 public:
  // nullopt once the channel is shut down
  std::optional<std::future<store::ApplyOutcome>> Submit(WorkerReport report);

  // Puts a report back after a transient failure. Accepted after shutdown
  // since the submitter is still waiting on it.
  void Requeue(PendingReport pending);

  // blocking wait; nullopt after shutdown once drained
  std::optional<PendingReport> Dequeue();

  void Shutdown();

  size_t Size() const;

 private:
  mutable std::mutex        mutex_;
  std::condition_variable   cv_;
  std::queue<PendingReport> queue_;
  bool                      shutdown_ = false;
};

} // namespace orchestrator::agent
