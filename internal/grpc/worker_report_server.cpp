#include "worker_report_server.hpp"

#include "grpc_error.hpp"

namespace orchestrator::grpc {

using namespace orchestrator::v1;

WorkerReportServer::WorkerReportServer(std::shared_ptr<orchestrator::service::WorkerReportService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkerReportServer::RegisterWorker(::grpc::ServerContext*, const RegisterWorkerRequest* req, RegisterWorkerResponse* resp) {
  try {
    *resp = service_->RegisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerReportServer::Heartbeat(::grpc::ServerContext*, const HeartbeatRequest* req, HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerReportServer::ReportReady(::grpc::ServerContext*, const ReportReadyRequest* req, ReportAck* resp) {
  try {
    *resp = service_->ReportReady(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerReportServer::ReportHealthFailure(::grpc::ServerContext*, const ReportHealthFailureRequest* req, ReportAck* resp) {
  try {
    *resp = service_->ReportHealthFailure(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerReportServer::ReportTerminated(::grpc::ServerContext*, const ReportTerminatedRequest* req, ReportAck* resp) {
  try {
    *resp = service_->ReportTerminated(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace orchestrator::grpc
