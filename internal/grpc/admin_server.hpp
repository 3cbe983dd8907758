#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "orchestrator/v1/admin.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace orchestrator::grpc {

class AdminServer final : public orchestrator::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<orchestrator::service::AdminService> svc);

  ::grpc::Status Acquire(::grpc::ServerContext*,
                       const orchestrator::v1::AcquireRequest*,
                       orchestrator::v1::AcquireResponse*) override;

  ::grpc::Status GetBackend(::grpc::ServerContext*,
                          const orchestrator::v1::GetBackendRequest*,
                          orchestrator::v1::GetBackendResponse*) override;

  ::grpc::Status ListBackends(::grpc::ServerContext*,
                            const orchestrator::v1::ListBackendsRequest*,
                            orchestrator::v1::ListBackendsResponse*) override;

  ::grpc::Status BackendHistory(::grpc::ServerContext*,
                              const orchestrator::v1::BackendHistoryRequest*,
                              orchestrator::v1::BackendHistoryResponse*) override;

  ::grpc::Status TerminateBackend(::grpc::ServerContext*,
                                const orchestrator::v1::TerminateBackendRequest*,
                                orchestrator::v1::TerminateBackendResponse*) override;

  ::grpc::Status ListWorkers(::grpc::ServerContext*,
                           const orchestrator::v1::ListWorkersRequest*,
                           orchestrator::v1::ListWorkersResponse*) override;

  ::grpc::Status DrainWorker(::grpc::ServerContext*,
                           const orchestrator::v1::DrainWorkerRequest*,
                           orchestrator::v1::DrainWorkerResponse*) override;

private:
  std::shared_ptr<orchestrator::service::AdminService> service_;
};

}
