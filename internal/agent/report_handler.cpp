#include "report_handler.hpp"

#include <stdexcept>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace orchestrator::agent {

using model::BackendEvent;
using model::BackendState;
using observability::StringField;

namespace {

std::string_view ToString(ReportKind kind) {
  switch (kind) {
    case ReportKind::kReady:
      return "ready";
    case ReportKind::kHealthFailure:
      return "health_failure";
    case ReportKind::kTerminated:
      return "terminated";
  }
  return "unknown";
}

} // namespace

ReportHandler::ReportHandler(std::shared_ptr<store::StateStore> store, std::shared_ptr<AgentRegistry> agents,
                             std::chrono::milliseconds drain_timeout)
    : store_(std::move(store)), agents_(std::move(agents)), drain_timeout_(drain_timeout) {
  if (!store_) {
    throw std::invalid_argument("report handler requires a state store");
  }
}

store::ApplyOutcome ReportHandler::Handle(const WorkerReport& report) {
  auto backend = store_->Get(report.backend_id);
  if (!backend) {
    ORCHESTRATOR_LOG_WARN("report for unknown backend",
                          {StringField("backend_id", report.backend_id), StringField("kind", ToString(report.kind))});
    return store::ApplyOutcome::kRejected;
  }
  if (!report.worker_id.empty() && report.worker_id != backend->worker_id) {
    ORCHESTRATOR_LOG_WARN("report from non-owning worker", {StringField("backend_id", report.backend_id),
                                                            StringField("worker_id", report.worker_id),
                                                            StringField("owner", backend->worker_id)});
    return store::ApplyOutcome::kRejected;
  }

  switch (report.kind) {
    case ReportKind::kReady:
      if (backend->state == BackendState::kDraining || model::IsTerminal(backend->state)) {
        DrainUnwanted(*backend);
      }
      if (backend->state == BackendState::kScheduled) {
        store_->ApplyEvent(report.backend_id, BackendEvent::kWorkerAcceptedPlacement, "implied by ready report");
      }
      return store_->ApplyEvent(report.backend_id, BackendEvent::kWorkerReportedReady, "worker reported ready",
                                report.address)
          .outcome;

    case ReportKind::kHealthFailure:
      return store_
          ->ApplyEvent(report.backend_id, BackendEvent::kWorkerReportedHealthFailure,
                       report.reason.empty() ? "worker reported health failure" : "health failure: " + report.reason)
          .outcome;

    case ReportKind::kTerminated:
      if (backend->state == BackendState::kReady) {
        store_->ApplyEvent(report.backend_id, BackendEvent::kDrainRequested, "implied by terminated report");
      }
      return store_->ApplyEvent(report.backend_id, BackendEvent::kWorkerReportedTerminated, "worker reported terminated")
          .outcome;
  }
  return store::ApplyOutcome::kRejected;
}

void ReportHandler::DrainUnwanted(const store::BackendRecord& backend) {
  if (!agents_) return;

  auto agent = agents_->Find(backend.worker_id);
  if (!agent) return;

  ORCHESTRATOR_LOG_INFO("draining instance reported ready after it was given up",
                        {StringField("backend_id", backend.id), StringField("worker_id", backend.worker_id),
                         StringField("state", model::ToString(backend.state))});
  try {
    agent->DrainBackend(backend.id, drain_timeout_);
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_WARN("drain of unwanted instance failed",
                          {StringField("backend_id", backend.id), StringField("worker_id", backend.worker_id),
                           StringField("error", e.what())});
  }
}

} // namespace orchestrator::agent
