#include "worker_report_service.hpp"

#include <future>
#include <stdexcept>

#include "internal/agent/agent_registry.hpp"
#include "internal/agent/report_channel.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace orchestrator::service {

using namespace orchestrator::v1;
using orchestrator::agent::ReportKind;
using orchestrator::agent::WorkerReport;
using orchestrator::store::ApplyOutcome;

namespace {

void RequireReport(const std::string& worker_id, const std::string& backend_id) {
  if (worker_id.empty() || backend_id.empty()) {
    throw std::invalid_argument("worker_id and backend_id are required");
  }
}

} // namespace

WorkerReportService::WorkerReportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterWorkerResponse WorkerReportService::RegisterWorker(const RegisterWorkerRequest& req) {
  return ObserveRpc("WorkerReportService.RegisterWorker", req.worker_id(), [&] {
    if (req.worker_id().empty() || req.agent_address().empty()) {
      throw std::invalid_argument("worker_id and agent_address are required");
    }

    const auto worker = ctx_.store->RegisterWorker(req.worker_id(), req.agent_address(), req.capacity_hint());
    if (ctx_.agents) {
      ctx_.agents->Connect(worker.id, worker.address);
    }

    ORCHESTRATOR_LOG_INFO("worker registered", {orchestrator::observability::StringField("worker_id", worker.id),
                                                orchestrator::observability::StringField("address", worker.address),
                                                orchestrator::observability::IntField("epoch", static_cast<int64_t>(worker.epoch))});

    RegisterWorkerResponse resp;
    resp.set_epoch(worker.epoch);
    *resp.mutable_heartbeat_interval() = orchestrator::util::ToProto(ctx_.leases->HeartbeatInterval());
    return resp;
  });
}

HeartbeatResponse WorkerReportService::Heartbeat(const HeartbeatRequest& req) {
  return ObserveRpc("WorkerReportService.Heartbeat", req.worker_id(), [&] {
    if (req.worker_id().empty()) {
      throw std::invalid_argument("worker_id is required");
    }

    HeartbeatResponse resp;
    resp.set_leases_renewed(static_cast<uint32_t>(ctx_.leases->Heartbeat(req.worker_id(), req.epoch())));
    return resp;
  });
}

ReportAck WorkerReportService::ReportReady(const ReportReadyRequest& req) {
  return ObserveRpc("WorkerReportService.ReportReady", req.backend_id(), [&] {
    RequireReport(req.worker_id(), req.backend_id());
    if (req.address().empty()) {
      throw std::invalid_argument("address is required");
    }

    WorkerReport report;
    report.kind       = ReportKind::kReady;
    report.worker_id  = req.worker_id();
    report.backend_id = req.backend_id();
    report.address    = req.address();
    return Submit(std::move(report));
  });
}

ReportAck WorkerReportService::ReportHealthFailure(const ReportHealthFailureRequest& req) {
  return ObserveRpc("WorkerReportService.ReportHealthFailure", req.backend_id(), [&] {
    RequireReport(req.worker_id(), req.backend_id());

    WorkerReport report;
    report.kind       = ReportKind::kHealthFailure;
    report.worker_id  = req.worker_id();
    report.backend_id = req.backend_id();
    report.reason     = req.reason();
    return Submit(std::move(report));
  });
}

ReportAck WorkerReportService::ReportTerminated(const ReportTerminatedRequest& req) {
  return ObserveRpc("WorkerReportService.ReportTerminated", req.backend_id(), [&] {
    RequireReport(req.worker_id(), req.backend_id());

    WorkerReport report;
    report.kind       = ReportKind::kTerminated;
    report.worker_id  = req.worker_id();
    report.backend_id = req.backend_id();
    return Submit(std::move(report));
  });
}

ReportAck WorkerReportService::Submit(WorkerReport report) {
  auto applied = ctx_.reports->Submit(std::move(report));
  if (!applied) {
    throw orchestrator::util::Unavailable("orchestrator is shutting down; resend the report");
  }
  if (applied->wait_for(ctx_.report_apply_timeout) != std::future_status::ready) {
    throw orchestrator::util::Unavailable("report not applied in time; resend the report");
  }

  ReportAck ack;
  switch (applied->get()) {
    case ApplyOutcome::kApplied:
      ack.set_outcome(REPORT_OUTCOME_APPLIED);
      break;
    case ApplyOutcome::kNoOp:
      ack.set_outcome(REPORT_OUTCOME_DUPLICATE);
      break;
    case ApplyOutcome::kRejected:
      ack.set_outcome(REPORT_OUTCOME_REJECTED);
      break;
  }
  return ack;
}

} // namespace orchestrator::service
