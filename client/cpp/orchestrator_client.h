#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "orchestrator/v1/admin.grpc.pb.h"
#include "orchestrator/v1/worker_report.grpc.pb.h"

namespace orchestrator::client {

/*
  Blocking client for the orchestrator's gRPC surface: the admin calls used
  by operators and the report calls a worker agent makes.

  Every call takes an optional deadline; zero means none.
*/
class OrchestratorClient {
 public:
  explicit OrchestratorClient(std::shared_ptr<grpc::Channel> channel,
                              std::chrono::milliseconds      deadline = std::chrono::milliseconds(0));

  static OrchestratorClient Connect(const std::string& address,
                                    std::chrono::milliseconds deadline = std::chrono::milliseconds(0));

  // Admin
  grpc::Status Acquire(const std::string& key, orchestrator::v1::AcquireResponse* response) const;
  grpc::Status GetBackend(const std::string& backend_id, orchestrator::v1::Backend* backend) const;
  grpc::Status ListBackends(bool live_only, orchestrator::v1::ListBackendsResponse* response) const;
  grpc::Status BackendHistory(const std::string& backend_id, orchestrator::v1::BackendHistoryResponse* response) const;
  grpc::Status TerminateBackend(const std::string& backend_id, orchestrator::v1::Backend* backend) const;
  grpc::Status ListWorkers(orchestrator::v1::ListWorkersResponse* response) const;
  grpc::Status DrainWorker(const std::string& worker_id, orchestrator::v1::Worker* worker) const;

  // Worker reports
  grpc::Status RegisterWorker(const std::string& worker_id, const std::string& agent_address, uint32_t capacity_hint,
                              orchestrator::v1::RegisterWorkerResponse* response) const;
  grpc::Status Heartbeat(const std::string& worker_id, uint64_t epoch, uint32_t* leases_renewed) const;
  grpc::Status ReportReady(const std::string& worker_id, const std::string& backend_id, const std::string& address) const;
  grpc::Status ReportHealthFailure(const std::string& worker_id, const std::string& backend_id,
                                   const std::string& reason) const;
  grpc::Status ReportTerminated(const std::string& worker_id, const std::string& backend_id) const;

 private:
  void PrepareContext(grpc::ClientContext* context) const;

  std::chrono::milliseconds                                         deadline_;
  std::shared_ptr<orchestrator::v1::AdminService::Stub>             admin_stub_;
  std::shared_ptr<orchestrator::v1::WorkerReportService::Stub>      report_stub_;
};

} // namespace orchestrator::client
