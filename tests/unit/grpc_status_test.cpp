#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/agent/agent_registry.hpp"
#include "internal/agent/report_channel.hpp"
#include "internal/core/placement_policy.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/worker_report_server.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/worker_report_service.hpp"
#include "internal/store/state_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using orchestrator::grpc::ToStatus;
namespace util = orchestrator::util;
namespace v1   = orchestrator::v1;

orchestrator::service::ServiceContext BuildServiceContext() {
  orchestrator::service::ServiceContext ctx;
  ctx.store     = std::make_shared<orchestrator::store::StateStore>(std::make_shared<orchestrator::db::memory::MemoryRepository>());
  ctx.agents    = std::make_shared<orchestrator::agent::AgentRegistry>();
  ctx.reports   = std::make_shared<orchestrator::agent::ReportChannel>();
  ctx.leases    = std::make_shared<orchestrator::lease::LeaseManager>(ctx.store, orchestrator::lease::LeaseOptions{});
  ctx.scheduler = std::make_shared<orchestrator::core::Scheduler>(
      ctx.store, ctx.agents, std::make_shared<orchestrator::core::LeastLoadedPolicy>(),
      orchestrator::core::SchedulerOptions{});
  return ctx;
}

void TestErrorMapping() {
  assert(ToStatus(util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(util::StaleEpoch("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(util::InvalidTransition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(util::VersionMismatch("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(util::BackendFailed("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(util::RouteTimeout("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(util::SchedulingFailed("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(util::PlacementFailed("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);

  auto internal = ToStatus(std::runtime_error("disk on fire"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "disk on fire");
}

void TestMissingBackendReturnsNotFound() {
  auto                             ctx = BuildServiceContext();
  orchestrator::grpc::AdminServer  server(std::make_shared<orchestrator::service::AdminService>(ctx));

  v1::GetBackendRequest req;
  req.set_backend_id("missing-backend");
  v1::GetBackendResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  auto status = server.GetBackend(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestAcquireWithoutWorkersIsUnavailable() {
  auto                            ctx = BuildServiceContext();
  orchestrator::grpc::AdminServer server(std::make_shared<orchestrator::service::AdminService>(ctx));

  v1::AcquireRequest req;
  req.set_key("session");
  v1::AcquireResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.Acquire(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAVAILABLE);

  req.clear_key();
  ::grpc::ServerContext empty_ctx;
  assert(server.Acquire(&empty_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestStaleHeartbeatIsFailedPrecondition() {
  auto                                   ctx = BuildServiceContext();
  orchestrator::grpc::WorkerReportServer server(std::make_shared<orchestrator::service::WorkerReportService>(ctx));

  v1::RegisterWorkerRequest reg;
  reg.set_worker_id("worker-a");
  reg.set_agent_address("127.0.0.1:9100");
  v1::RegisterWorkerResponse reg_resp;
  ::grpc::ServerContext      reg_ctx;
  assert(server.RegisterWorker(&reg_ctx, &reg, &reg_resp).ok());
  assert(reg_resp.epoch() == 1);

  ::grpc::ServerContext again_ctx;
  assert(server.RegisterWorker(&again_ctx, &reg, &reg_resp).ok());

  v1::HeartbeatRequest heartbeat;
  heartbeat.set_worker_id("worker-a");
  heartbeat.set_epoch(1);
  v1::HeartbeatResponse hb_resp;
  ::grpc::ServerContext hb_ctx;
  assert(server.Heartbeat(&hb_ctx, &heartbeat, &hb_resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestUnappliedReportIsUnavailable() {
  auto ctx                 = BuildServiceContext();
  ctx.report_apply_timeout = std::chrono::milliseconds(20);
  orchestrator::grpc::WorkerReportServer server(std::make_shared<orchestrator::service::WorkerReportService>(ctx));

  // Nothing drains the channel, so the report never commits.
  v1::ReportReadyRequest ready;
  ready.set_worker_id("worker-a");
  ready.set_backend_id("backend-1");
  ready.set_address("10.0.0.4:7001");
  v1::ReportAck         ack;
  ::grpc::ServerContext grpc_ctx;
  assert(server.ReportReady(&grpc_ctx, &ready, &ack).error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

} // namespace

int main() {
  TestErrorMapping();
  TestMissingBackendReturnsNotFound();
  TestAcquireWithoutWorkersIsUnavailable();
  TestStaleHeartbeatIsFailedPrecondition();
  TestUnappliedReportIsUnavailable();

  std::cout << "orchestrator_unit_grpc_status: pass\n";
  return 0;
}
