#include "grpc_worker_agent.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace orchestrator::agent {

namespace {

void SetDeadline(grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

} // namespace

GrpcWorkerAgent::GrpcWorkerAgent(std::string worker_id, std::shared_ptr<grpc::Channel> channel)
    : worker_id_(std::move(worker_id)), stub_(orchestrator::v1::WorkerAgentService::NewStub(std::move(channel))) {
}

std::shared_ptr<WorkerAgent> GrpcWorkerAgent::Connect(const std::string& worker_id, const std::string& address) {
  return std::make_shared<GrpcWorkerAgent>(worker_id, grpc::CreateChannel(address, grpc::InsecureChannelCredentials()));
}

PlacementReply GrpcWorkerAgent::PlaceBackend(const PlacementSpec& spec, std::chrono::milliseconds timeout) {
  orchestrator::v1::PlaceBackendRequest req;
  auto*                                 out = req.mutable_spec();
  out->set_backend_id(spec.backend_id);
  out->set_key(spec.key);
  out->set_worker_epoch(spec.worker_epoch);
  *out->mutable_lease_duration() = util::ToProto(spec.lease_duration);

  orchestrator::v1::PlaceBackendResponse resp;
  grpc::ClientContext                    ctx;
  SetDeadline(ctx, timeout);

  const auto status = stub_->PlaceBackend(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::PlacementFailed("place on " + worker_id_ + " failed: " + status.error_message());
  }
  return PlacementReply{resp.accepted(), resp.reason()};
}

void GrpcWorkerAgent::DrainBackend(const std::string& backend_id, std::chrono::milliseconds timeout) {
  orchestrator::v1::DrainBackendRequest req;
  req.set_backend_id(backend_id);

  orchestrator::v1::DrainBackendResponse resp;
  grpc::ClientContext                    ctx;
  SetDeadline(ctx, timeout);

  const auto status = stub_->DrainBackend(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::Unavailable("drain on " + worker_id_ + " failed: " + status.error_message());
  }
}

} // namespace orchestrator::agent
