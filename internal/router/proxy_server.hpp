#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace orchestrator::router {

class Router;

struct ProxyOptions {
  // host:port; port 0 picks an ephemeral port.
  std::string bind_address = "0.0.0.0:7000";
  // Longest accepted key line, newline included.
  size_t max_preamble_bytes = 1024;
};

/*
  ProxyServer

  Client-facing TCP listener. A client sends its routing key as the first
  line, then the connection is spliced to the key's backend. Failures are
  answered with one "ERR <CODE> <message>" line before closing.

  One thread per client connection.
*/
class ProxyServer {
 public:
  ProxyServer(std::shared_ptr<Router> router, ProxyOptions options);
  ~ProxyServer();

  ProxyServer(const ProxyServer&)            = delete;
  ProxyServer& operator=(const ProxyServer&) = delete;

  // Binds and starts accepting. Throws std::runtime_error.
  void Start();
  void Stop();

  // Bound port, valid after Start().
  uint16_t Port() const {
    return port_;
  }

  // Client connections still being served.
  size_t ActiveSessions() const;

 private:
  struct Session {
    int               fd = -1;
    std::thread       thread;
    std::atomic<bool> done{false};
  };

  void AcceptLoop();
  void Serve(Session& session);
  void ReapFinished();

  std::shared_ptr<Router> router_;
  ProxyOptions            options_;

  int               listen_fd_ = -1;
  uint16_t          port_      = 0;
  std::atomic<bool> running_{false};
  std::thread       acceptor_;

  mutable std::mutex                  sessions_mutex_;
  std::list<std::unique_ptr<Session>> sessions_;
};

// Wire form of a routing failure: "ERR <CODE> <message>\n".
std::string ErrorLine(const std::exception& error);

} // namespace orchestrator::router
