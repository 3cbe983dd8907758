#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <grpcpp/grpcpp.h>

#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/orchestrator_client.h"
#include "internal/util/time.hpp"
#include "orchestrator/v1/worker_agent.grpc.pb.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleSignal(int) {
  g_stop = true;
}

// Reports are acknowledged only once applied; UNAVAILABLE means resend.
template <typename Fn>
grpc::Status Resend(Fn&& send) {
  auto backoff = std::chrono::milliseconds(100);
  for (int attempt = 1;; ++attempt) {
    auto status = send();
    if (status.error_code() != grpc::StatusCode::UNAVAILABLE || attempt == 5 || g_stop) return status;
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

/*
  Stand-in session backend: echoes bytes back on a loopback port until
  drained.
*/
class EchoBackend {
 public:
  EchoBackend() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) throw std::runtime_error("socket failed");
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len        = sizeof(addr);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), len) != 0 || ::listen(fd_, 16) != 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      ::close(fd_);
      throw std::runtime_error("echo listener setup failed");
    }
    port_   = ntohs(addr.sin_port);
    thread_ = std::thread([this] { AcceptLoop(); });
  }

  ~EchoBackend() {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    thread_.join();
  }

  std::string Address() const {
    return "127.0.0.1:" + std::to_string(port_);
  }

 private:
  void AcceptLoop() {
    for (;;) {
      const int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) return;
      std::thread([client] {
        std::array<char, 4096> buffer{};
        for (;;) {
          const ssize_t n = ::recv(client, buffer.data(), buffer.size(), 0);
          if (n <= 0) break;
          if (::send(client, buffer.data(), static_cast<size_t>(n), MSG_NOSIGNAL) < 0) break;
        }
        ::close(client);
      }).detach();
    }
  }

  int         fd_   = -1;
  uint16_t    port_ = 0;
  std::thread thread_;
};

/*
  Agent side of the simulated worker. Placements load for `load_delay`,
  then report Ready; drains close the listener and report Terminated.
*/
class SimulatedAgent final : public orchestrator::v1::WorkerAgentService::Service {
 public:
  SimulatedAgent(const orchestrator::client::OrchestratorClient& client, std::string worker_id, uint32_t capacity,
                 std::chrono::milliseconds load_delay)
      : client_(client), worker_id_(std::move(worker_id)), capacity_(capacity), load_delay_(load_delay) {
  }

  ~SimulatedAgent() override {
    for (auto& t : loaders_) t.join();
  }

  grpc::Status PlaceBackend(grpc::ServerContext*, const orchestrator::v1::PlaceBackendRequest* req,
                            orchestrator::v1::PlaceBackendResponse* resp) override {
    const auto backend_id = req->spec().backend_id();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (capacity_ > 0 && backends_.size() >= capacity_) {
        resp->set_accepted(false);
        resp->set_reason("worker at capacity");
        return grpc::Status::OK;
      }
      backends_.emplace(backend_id, nullptr);
      loaders_.emplace_back([this, backend_id, key = req->spec().key()] { Load(backend_id, key); });
    }
    resp->set_accepted(true);
    std::cout << "placed " << backend_id << " for key " << req->spec().key() << '\n';
    return grpc::Status::OK;
  }

  grpc::Status DrainBackend(grpc::ServerContext*, const orchestrator::v1::DrainBackendRequest* req,
                            orchestrator::v1::DrainBackendResponse*) override {
    std::unique_ptr<EchoBackend> backend;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto                        it = backends_.find(req->backend_id());
      if (it != backends_.end()) {
        backend = std::move(it->second);
        backends_.erase(it);
      }
    }
    backend.reset();

    // Report even for unknown ids: the orchestrator treats it as idempotent.
    auto status = Resend([&] { return client_.ReportTerminated(worker_id_, req->backend_id()); });
    if (!status.ok()) {
      std::cerr << "ReportTerminated failed: " << status.error_message() << '\n';
    }
    std::cout << "drained " << req->backend_id() << '\n';
    return grpc::Status::OK;
  }

 private:
  void Load(const std::string& backend_id, const std::string& key) {
    std::this_thread::sleep_for(load_delay_);

    std::unique_ptr<EchoBackend> backend;
    try {
      backend = std::make_unique<EchoBackend>();
    } catch (const std::exception& e) {
      auto status = Resend([&] { return client_.ReportHealthFailure(worker_id_, backend_id, e.what()); });
      if (!status.ok()) std::cerr << "ReportHealthFailure failed: " << status.error_message() << '\n';
      return;
    }

    const auto address = backend->Address();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto                        it = backends_.find(backend_id);
      // Drained while loading.
      if (it == backends_.end()) return;
      it->second = std::move(backend);
    }

    auto status = Resend([&] { return client_.ReportReady(worker_id_, backend_id, address); });
    if (!status.ok()) {
      std::cerr << "ReportReady failed: " << status.error_message() << '\n';
      return;
    }
    std::cout << "ready " << backend_id << " (" << key << ") at " << address << '\n';
  }

  const orchestrator::client::OrchestratorClient& client_;
  std::string                                     worker_id_;
  uint32_t                                        capacity_;
  std::chrono::milliseconds                       load_delay_;

  std::mutex                                          mutex_;
  std::map<std::string, std::unique_ptr<EchoBackend>> backends_;
  std::vector<std::thread>                            loaders_;
};

} // namespace

int main(int argc, char** argv) {
  const std::string orchestrator_address = argc > 1 ? argv[1] : "localhost:50051";
  const std::string worker_id            = argc > 2 ? argv[2] : "worker-sim-1";
  const std::string agent_address        = argc > 3 ? argv[3] : "127.0.0.1:50061";
  const uint32_t    capacity             = argc > 4 ? static_cast<uint32_t>(std::stoul(argv[4])) : 4;

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  auto client = orchestrator::client::OrchestratorClient::Connect(orchestrator_address, std::chrono::milliseconds(5000));

  SimulatedAgent      agent(client, worker_id, capacity, std::chrono::milliseconds(500));
  grpc::ServerBuilder builder;
  builder.AddListeningPort(agent_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&agent);
  auto server = builder.BuildAndStart();
  if (!server) {
    std::cerr << "failed to listen on " << agent_address << '\n';
    return 1;
  }

  orchestrator::v1::RegisterWorkerResponse registration;
  auto                                     status = client.RegisterWorker(worker_id, agent_address, capacity, &registration);
  if (!status.ok()) {
    std::cerr << "RegisterWorker failed: " << status.error_message() << '\n';
    return 1;
  }
  const auto interval = orchestrator::util::DurationOr(registration.heartbeat_interval(), std::chrono::milliseconds(5000));
  std::cout << worker_id << " registered with epoch " << registration.epoch() << ", heartbeat every " << interval.count()
            << "ms\n";

  while (!g_stop) {
    std::this_thread::sleep_for(interval);

    uint32_t renewed = 0;
    status           = client.Heartbeat(worker_id, registration.epoch(), &renewed);
    if (status.error_code() == grpc::StatusCode::FAILED_PRECONDITION) {
      // Declared lost: our leases are gone, start a new session.
      std::cerr << "heartbeat rejected (" << status.error_message() << "), re-registering\n";
      status = client.RegisterWorker(worker_id, agent_address, capacity, &registration);
      if (!status.ok()) std::cerr << "RegisterWorker failed: " << status.error_message() << '\n';
    } else if (!status.ok()) {
      std::cerr << "heartbeat failed: " << status.error_message() << '\n';
    }
  }

  server->Shutdown();
  return 0;
}
