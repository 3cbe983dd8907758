#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "orchestrator/v1/worker_report.grpc.pb.h"
#include "internal/service/worker_report_service.hpp"

namespace orchestrator::grpc {

class WorkerReportServer final : public orchestrator::v1::WorkerReportService::Service {
public:
  explicit WorkerReportServer(std::shared_ptr<orchestrator::service::WorkerReportService> svc);

  ::grpc::Status RegisterWorker(::grpc::ServerContext*,
                                const orchestrator::v1::RegisterWorkerRequest*,
                                orchestrator::v1::RegisterWorkerResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*,
                           const orchestrator::v1::HeartbeatRequest*,
                           orchestrator::v1::HeartbeatResponse*) override;

  ::grpc::Status ReportReady(::grpc::ServerContext*,
                             const orchestrator::v1::ReportReadyRequest*,
                             orchestrator::v1::ReportAck*) override;

  ::grpc::Status ReportHealthFailure(::grpc::ServerContext*,
                                     const orchestrator::v1::ReportHealthFailureRequest*,
                                     orchestrator::v1::ReportAck*) override;

  ::grpc::Status ReportTerminated(::grpc::ServerContext*,
                                  const orchestrator::v1::ReportTerminatedRequest*,
                                  orchestrator::v1::ReportAck*) override;

private:
  std::shared_ptr<orchestrator::service::WorkerReportService> service_;
};

}
