#include "admin_service.hpp"

#include <stdexcept>
#include <unordered_map>

#include "converters.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace orchestrator::service {

using namespace orchestrator::v1;

namespace {

void RequireId(const std::string& value, const char* field) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(field) + " is required");
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AcquireResponse AdminService::Acquire(const AcquireRequest& req) {
  return ObserveRpc("AdminService.Acquire", req.key(), [&] {
    RequireId(req.key(), "key");
    auto handle = ctx_.scheduler->Acquire(req.key());

    AcquireResponse resp;
    *resp.mutable_backend() = ToProto(handle.backend);
    resp.set_created(handle.created);
    return resp;
  });
}

GetBackendResponse AdminService::GetBackend(const GetBackendRequest& req) {
  return ObserveRpc("AdminService.GetBackend", req.backend_id(), [&] {
    RequireId(req.backend_id(), "backend_id");
    auto backend = ctx_.store->Get(req.backend_id());
    if (!backend) {
      throw orchestrator::util::NotFound("backend not found: " + req.backend_id());
    }

    GetBackendResponse resp;
    *resp.mutable_backend() = ToProto(*backend);
    return resp;
  });
}

ListBackendsResponse AdminService::ListBackends(const ListBackendsRequest& req) {
  return ObserveRpc("AdminService.ListBackends", "", [&] {
    const auto backends = req.live_only() ? ctx_.store->ListLive() : ctx_.store->ListBackends();

    ListBackendsResponse resp;
    for (const auto& backend : backends) {
      *resp.add_backends() = ToProto(backend);
    }
    return resp;
  });
}

BackendHistoryResponse AdminService::BackendHistory(const BackendHistoryRequest& req) {
  return ObserveRpc("AdminService.BackendHistory", req.backend_id(), [&] {
    RequireId(req.backend_id(), "backend_id");

    BackendHistoryResponse resp;
    for (const auto& entry : ctx_.store->History(req.backend_id())) {
      *resp.add_entries() = ToProto(entry);
    }
    return resp;
  });
}

TerminateBackendResponse AdminService::TerminateBackend(const TerminateBackendRequest& req) {
  return ObserveRpc("AdminService.TerminateBackend", req.backend_id(), [&] {
    RequireId(req.backend_id(), "backend_id");

    TerminateBackendResponse resp;
    *resp.mutable_backend() = ToProto(ctx_.scheduler->Terminate(req.backend_id()));
    return resp;
  });
}

ListWorkersResponse AdminService::ListWorkers(const ListWorkersRequest&) {
  return ObserveRpc("AdminService.ListWorkers", "", [&] {
    std::unordered_map<std::string, uint32_t> live;
    for (const auto& backend : ctx_.store->ListLive()) {
      ++live[backend.worker_id];
    }

    ListWorkersResponse resp;
    for (const auto& worker : ctx_.store->ListWorkers()) {
      *resp.add_workers() = ToProto(worker, live[worker.id]);
    }
    return resp;
  });
}

DrainWorkerResponse AdminService::DrainWorker(const DrainWorkerRequest& req) {
  return ObserveRpc("AdminService.DrainWorker", req.worker_id(), [&] {
    RequireId(req.worker_id(), "worker_id");
    const auto worker = ctx_.scheduler->DrainWorker(req.worker_id());

    uint32_t live = 0;
    for (const auto& backend : ctx_.store->ListByWorker(worker.id)) {
      if (orchestrator::model::IsLive(backend.state)) ++live;
    }

    DrainWorkerResponse resp;
    *resp.mutable_worker() = ToProto(worker, live);
    return resp;
  });
}

} // namespace orchestrator::service
