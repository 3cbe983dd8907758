#pragma once

#include <memory>
#include <string>

#include <grpcpp/channel.h>

#include "orchestrator/v1/worker_agent.grpc.pb.h"
#include "worker_agent.hpp"

namespace orchestrator::agent {

// WorkerAgent over the worker's WorkerAgentService endpoint.
class GrpcWorkerAgent final : public WorkerAgent {
 public:
  GrpcWorkerAgent(std::string worker_id, std::shared_ptr<grpc::Channel> channel);

  // Insecure channel to `address`.
  static std::shared_ptr<WorkerAgent> Connect(const std::string& worker_id, const std::string& address);

  PlacementReply PlaceBackend(const PlacementSpec& spec, std::chrono::milliseconds timeout) override;

  void DrainBackend(const std::string& backend_id, std::chrono::milliseconds timeout) override;

 private:
  std::string                                                  worker_id_;
  std::unique_ptr<orchestrator::v1::WorkerAgentService::Stub> stub_;
};

} // namespace orchestrator::agent
