#include "client/cpp/orchestrator_client.h"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

namespace orchestrator::client {

using namespace orchestrator::v1;

OrchestratorClient::OrchestratorClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline)
    : deadline_(deadline), admin_stub_(AdminService::NewStub(channel)), report_stub_(WorkerReportService::NewStub(channel)) {
}

OrchestratorClient OrchestratorClient::Connect(const std::string& address, std::chrono::milliseconds deadline) {
  return OrchestratorClient(grpc::CreateChannel(address, grpc::InsecureChannelCredentials()), deadline);
}

void OrchestratorClient::PrepareContext(grpc::ClientContext* context) const {
  if (deadline_.count() > 0) {
    context->set_deadline(std::chrono::system_clock::now() + deadline_);
  }
}

grpc::Status OrchestratorClient::Acquire(const std::string& key, AcquireResponse* response) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  AcquireRequest request;
  request.set_key(key);
  return admin_stub_->Acquire(&context, request, response);
}

grpc::Status OrchestratorClient::GetBackend(const std::string& backend_id, Backend* backend) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  GetBackendRequest request;
  request.set_backend_id(backend_id);
  GetBackendResponse response;
  auto status = admin_stub_->GetBackend(&context, request, &response);
  if (status.ok()) {
    *backend = response.backend();
  }
  return status;
}

grpc::Status OrchestratorClient::ListBackends(bool live_only, ListBackendsResponse* response) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  ListBackendsRequest request;
  request.set_live_only(live_only);
  return admin_stub_->ListBackends(&context, request, response);
}

grpc::Status OrchestratorClient::BackendHistory(const std::string& backend_id, BackendHistoryResponse* response) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  BackendHistoryRequest request;
  request.set_backend_id(backend_id);
  return admin_stub_->BackendHistory(&context, request, response);
}

grpc::Status OrchestratorClient::TerminateBackend(const std::string& backend_id, Backend* backend) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  TerminateBackendRequest request;
  request.set_backend_id(backend_id);
  TerminateBackendResponse response;
  auto status = admin_stub_->TerminateBackend(&context, request, &response);
  if (status.ok()) {
    *backend = response.backend();
  }
  return status;
}

grpc::Status OrchestratorClient::ListWorkers(ListWorkersResponse* response) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  return admin_stub_->ListWorkers(&context, ListWorkersRequest{}, response);
}

grpc::Status OrchestratorClient::DrainWorker(const std::string& worker_id, Worker* worker) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  DrainWorkerRequest request;
  request.set_worker_id(worker_id);
  DrainWorkerResponse response;
  auto status = admin_stub_->DrainWorker(&context, request, &response);
  if (status.ok()) {
    *worker = response.worker();
  }
  return status;
}

grpc::Status OrchestratorClient::RegisterWorker(const std::string& worker_id, const std::string& agent_address,
                                                uint32_t capacity_hint, RegisterWorkerResponse* response) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  RegisterWorkerRequest request;
  request.set_worker_id(worker_id);
  request.set_agent_address(agent_address);
  request.set_capacity_hint(capacity_hint);
  return report_stub_->RegisterWorker(&context, request, response);
}

grpc::Status OrchestratorClient::Heartbeat(const std::string& worker_id, uint64_t epoch, uint32_t* leases_renewed) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  HeartbeatRequest request;
  request.set_worker_id(worker_id);
  request.set_epoch(epoch);
  HeartbeatResponse response;
  auto status = report_stub_->Heartbeat(&context, request, &response);
  if (status.ok() && leases_renewed) {
    *leases_renewed = response.leases_renewed();
  }
  return status;
}

grpc::Status OrchestratorClient::ReportReady(const std::string& worker_id, const std::string& backend_id,
                                             const std::string& address) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  ReportReadyRequest request;
  request.set_worker_id(worker_id);
  request.set_backend_id(backend_id);
  request.set_address(address);
  ReportAck ack;
  return report_stub_->ReportReady(&context, request, &ack);
}

grpc::Status OrchestratorClient::ReportHealthFailure(const std::string& worker_id, const std::string& backend_id,
                                                     const std::string& reason) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  ReportHealthFailureRequest request;
  request.set_worker_id(worker_id);
  request.set_backend_id(backend_id);
  request.set_reason(reason);
  ReportAck ack;
  return report_stub_->ReportHealthFailure(&context, request, &ack);
}

grpc::Status OrchestratorClient::ReportTerminated(const std::string& worker_id, const std::string& backend_id) const {
  grpc::ClientContext context;
  PrepareContext(&context);
  ReportTerminatedRequest request;
  request.set_worker_id(worker_id);
  request.set_backend_id(backend_id);
  ReportAck ack;
  return report_stub_->ReportTerminated(&context, request, &ack);
}

} // namespace orchestrator::client
