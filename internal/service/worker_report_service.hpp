#pragma once

#include "orchestrator/v1/worker_report.pb.h"
#include "internal/agent/report_channel.hpp"
#include "service_context.hpp"

namespace orchestrator::service {

/*
  Worker -> orchestrator reports.

  Registration and heartbeats are applied inline so the worker learns its
  epoch or a StaleEpoch rejection. Lifecycle reports go through the report
  channel; the RPC returns once the dispatcher committed the report, and
  throws util::Unavailable when it did not, so the worker resends.
*/
class WorkerReportService {
public:
  explicit WorkerReportService(ServiceContext ctx);

  orchestrator::v1::RegisterWorkerResponse RegisterWorker(const orchestrator::v1::RegisterWorkerRequest& req);

  orchestrator::v1::HeartbeatResponse Heartbeat(const orchestrator::v1::HeartbeatRequest& req);

  orchestrator::v1::ReportAck ReportReady(const orchestrator::v1::ReportReadyRequest& req);

  orchestrator::v1::ReportAck ReportHealthFailure(const orchestrator::v1::ReportHealthFailureRequest& req);

  orchestrator::v1::ReportAck ReportTerminated(const orchestrator::v1::ReportTerminatedRequest& req);

private:
  orchestrator::v1::ReportAck Submit(orchestrator::agent::WorkerReport report);

  ServiceContext ctx_;
};

}
