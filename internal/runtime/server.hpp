#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace orchestrator::runtime {

struct ServerOptions {
  std::string               bind_address   = "0.0.0.0:50051";
  std::chrono::milliseconds shutdown_grace = std::chrono::milliseconds(5000);
};

/*
  gRPC host for the admin and worker report services.

  Also serves the standard grpc.health.v1 service; every hosted service is
  reported SERVING once Start() returns and NOT_SERVING from Stop() on, so
  workers stop reporting before the listener goes away.
*/
class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error if the address cannot be bound.
  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one for ":0".
  int Port() const {
    return port_;
  }

private:
  void SetServing(bool serving);

  ServerOptions options_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> grpc_server_;
  int port_ = 0;
};

} // namespace orchestrator::runtime
