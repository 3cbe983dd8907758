#pragma once

#include "orchestrator/v1/admin.pb.h"
#include "service_context.hpp"

namespace orchestrator::service {

/*
  Operator surface: inspection plus acquire, terminate and worker drain.
*/
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  orchestrator::v1::AcquireResponse Acquire(const orchestrator::v1::AcquireRequest& req);

  orchestrator::v1::GetBackendResponse GetBackend(const orchestrator::v1::GetBackendRequest& req);

  orchestrator::v1::ListBackendsResponse ListBackends(const orchestrator::v1::ListBackendsRequest& req);

  orchestrator::v1::BackendHistoryResponse BackendHistory(const orchestrator::v1::BackendHistoryRequest& req);

  orchestrator::v1::TerminateBackendResponse TerminateBackend(const orchestrator::v1::TerminateBackendRequest& req);

  orchestrator::v1::ListWorkersResponse ListWorkers(const orchestrator::v1::ListWorkersRequest& req);

  orchestrator::v1::DrainWorkerResponse DrainWorker(const orchestrator::v1::DrainWorkerRequest& req);

private:
  ServiceContext ctx_;
};

}
