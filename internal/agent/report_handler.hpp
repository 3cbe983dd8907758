#pragma once

#include <chrono>
#include <memory>

#include "agent_registry.hpp"
#include "internal/store/state_store.hpp"
#include "report_channel.hpp"

namespace orchestrator::agent {

/*
  Applies worker reports to the state machine.

  Idempotent: a re-delivered report is a NoOp (a duplicate Ready keeps the
  recorded address). Reports that arrive ahead of an event the orchestrator
  has not recorded yet apply the implied event first, so the log stays a
  valid walk:

      Ready      on Scheduled -> WorkerAcceptedPlacement, WorkerReportedReady
      Terminated on Ready     -> DrainRequested, WorkerReportedTerminated

  Reports from a worker that does not own the backend are dropped.

  A Ready report for a backend that is Draining or already terminal (its
  placement timed out, its lease expired) means the worker runs an instance
  nobody routes to; with an agent registry the handler tells the worker to
  drain it. That drain is best-effort.
*/
class ReportHandler {
 public:
  explicit ReportHandler(std::shared_ptr<store::StateStore> store, std::shared_ptr<AgentRegistry> agents = nullptr,
                         std::chrono::milliseconds drain_timeout = std::chrono::milliseconds(5000));

  store::ApplyOutcome Handle(const WorkerReport& report);

 private:
  void DrainUnwanted(const store::BackendRecord& backend);

  std::shared_ptr<store::StateStore> store_;
  std::shared_ptr<AgentRegistry>     agents_;
  std::chrono::milliseconds          drain_timeout_;
};

} // namespace orchestrator::agent
