#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace orchestrator::grpc {

using namespace orchestrator::v1;

AdminServer::AdminServer(std::shared_ptr<orchestrator::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Acquire(::grpc::ServerContext*, const AcquireRequest* req, AcquireResponse* resp) {
  try {
    *resp = service_->Acquire(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetBackend(::grpc::ServerContext*, const GetBackendRequest* req, GetBackendResponse* resp) {
  try {
    *resp = service_->GetBackend(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListBackends(::grpc::ServerContext*, const ListBackendsRequest* req, ListBackendsResponse* resp) {
  try {
    *resp = service_->ListBackends(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::BackendHistory(::grpc::ServerContext*, const BackendHistoryRequest* req, BackendHistoryResponse* resp) {
  try {
    *resp = service_->BackendHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::TerminateBackend(::grpc::ServerContext*, const TerminateBackendRequest* req, TerminateBackendResponse* resp) {
  try {
    *resp = service_->TerminateBackend(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListWorkers(::grpc::ServerContext*, const ListWorkersRequest* req, ListWorkersResponse* resp) {
  try {
    *resp = service_->ListWorkers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::DrainWorker(::grpc::ServerContext*, const DrainWorkerRequest* req, DrainWorkerResponse* resp) {
  try {
    *resp = service_->DrainWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace orchestrator::grpc
