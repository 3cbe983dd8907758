#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "connector.hpp"

namespace orchestrator::router {

/*
  A connection handed out by the router. Untracks itself when the last
  reference goes away.
*/
class RoutedConnection {
 public:
  RoutedConnection(std::string backend_id, std::string address, std::unique_ptr<Connection> stream,
                   std::function<void()> release);
  ~RoutedConnection();

  RoutedConnection(const RoutedConnection&)            = delete;
  RoutedConnection& operator=(const RoutedConnection&) = delete;

  const std::string& BackendId() const {
    return backend_id_;
  }
  const std::string& Address() const {
    return address_;
  }
  Connection& Stream() {
    return *stream_;
  }

  void Close();

 private:
  std::string                 backend_id_;
  std::string                 address_;
  std::unique_ptr<Connection> stream_;
  std::function<void()>       release_;
};

/*
  ConnectionTracker

  Open routed connections per backend and the grace deadline of backends
  that started draining while connections were open.
*/
class ConnectionTracker : public std::enable_shared_from_this<ConnectionTracker> {
 public:
  using Clock = std::chrono::steady_clock;

  std::shared_ptr<RoutedConnection> Track(const std::string& backend_id, const std::string& address,
                                          std::unique_ptr<Connection> stream);

  size_t OpenCount(const std::string& backend_id) const;

  // Returns false when nothing is open for the backend; no deadline is
  // recorded in that case.
  bool BeginDrain(const std::string& backend_id, Clock::time_point deadline);
  bool IsDraining(const std::string& backend_id) const;

  // Force-closes connections of draining backends whose deadline passed and
  // returns those backend ids.
  std::vector<std::string> CloseExpired(Clock::time_point now);

  // Force-closes everything open for the backend.
  size_t CloseBackend(const std::string& backend_id);
  // On router shutdown.
  size_t CloseAll();

 private:
  struct Entry {
    std::unordered_map<uint64_t, std::weak_ptr<RoutedConnection>> open;
    std::optional<Clock::time_point>                              drain_deadline;
  };

  void Release(const std::string& backend_id, uint64_t serial);

  static size_t CloseEach(const std::vector<std::shared_ptr<RoutedConnection>>& connections);

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> backends_;
  uint64_t                               next_serial_ = 1;
};

} // namespace orchestrator::router
