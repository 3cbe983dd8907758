#include "server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace orchestrator::runtime {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

Server::Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  grpc::EnableDefaultHealthCheckService(true);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, grpc::InsecureServerCredentials(), &port_);

  // Thin adapters; ownership stays here.
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("Failed to start gRPC server on " + options_.bind_address);
  }

  SetServing(true);
  ORCHESTRATOR_LOG_INFO("gRPC server listening", {StringField("bind_address", options_.bind_address),
                                                  IntField("port", port_),
                                                  IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;

  SetServing(false);
  ORCHESTRATOR_LOG_INFO("gRPC server stopping", {DurationField("grace", options_.shutdown_grace)});
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
}

void Server::SetServing(bool serving) {
  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(serving);
  }
}

} // namespace orchestrator::runtime
