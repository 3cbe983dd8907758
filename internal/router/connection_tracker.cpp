#include "connection_tracker.hpp"

namespace orchestrator::router {

RoutedConnection::RoutedConnection(std::string backend_id, std::string address, std::unique_ptr<Connection> stream,
                                   std::function<void()> release)
    : backend_id_(std::move(backend_id)), address_(std::move(address)), stream_(std::move(stream)),
      release_(std::move(release)) {
}

RoutedConnection::~RoutedConnection() {
  Close();
  if (release_) {
    release_();
  }
}

void RoutedConnection::Close() {
  if (stream_) {
    stream_->Close();
  }
}

std::shared_ptr<RoutedConnection> ConnectionTracker::Track(const std::string& backend_id, const std::string& address,
                                                           std::unique_ptr<Connection> stream) {
  uint64_t serial = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    serial = next_serial_++;
  }

  std::weak_ptr<ConnectionTracker> weak = weak_from_this();
  auto connection = std::make_shared<RoutedConnection>(backend_id, address, std::move(stream), [weak, backend_id, serial] {
    if (auto tracker = weak.lock()) {
      tracker->Release(backend_id, serial);
    }
  });

  std::lock_guard<std::mutex> lock(mutex_);
  backends_[backend_id].open.emplace(serial, connection);
  return connection;
}

void ConnectionTracker::Release(const std::string& backend_id, uint64_t serial) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = backends_.find(backend_id);
  if (it == backends_.end()) {
    return;
  }
  it->second.open.erase(serial);
  if (it->second.open.empty()) {
    backends_.erase(it);
  }
}

size_t ConnectionTracker::OpenCount(const std::string& backend_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = backends_.find(backend_id);
  return it == backends_.end() ? 0 : it->second.open.size();
}

bool ConnectionTracker::BeginDrain(const std::string& backend_id, Clock::time_point deadline) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = backends_.find(backend_id);
  if (it == backends_.end() || it->second.open.empty()) {
    return false;
  }
  if (!it->second.drain_deadline) {
    it->second.drain_deadline = deadline;
  }
  return true;
}

bool ConnectionTracker::IsDraining(const std::string& backend_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = backends_.find(backend_id);
  return it != backends_.end() && it->second.drain_deadline.has_value();
}

std::vector<std::string> ConnectionTracker::CloseExpired(Clock::time_point now) {
  std::vector<std::string>                       expired;
  std::vector<std::shared_ptr<RoutedConnection>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = backends_.begin(); it != backends_.end();) {
      if (!it->second.drain_deadline || *it->second.drain_deadline > now) {
        ++it;
        continue;
      }
      expired.push_back(it->first);
      for (const auto& [serial, weak] : it->second.open) {
        if (auto connection = weak.lock()) {
          to_close.push_back(std::move(connection));
        }
      }
      it = backends_.erase(it);
    }
  }
  // Outside the lock: dropping the last reference re-enters Release.
  CloseEach(to_close);
  return expired;
}

size_t ConnectionTracker::CloseBackend(const std::string& backend_id) {
  std::vector<std::shared_ptr<RoutedConnection>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(backend_id);
    if (it == backends_.end()) {
      return 0;
    }
    for (const auto& [serial, weak] : it->second.open) {
      if (auto connection = weak.lock()) {
        to_close.push_back(std::move(connection));
      }
    }
    backends_.erase(it);
  }
  return CloseEach(to_close);
}

size_t ConnectionTracker::CloseAll() {
  std::vector<std::shared_ptr<RoutedConnection>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : backends_) {
      for (const auto& [serial, weak] : entry.open) {
        if (auto connection = weak.lock()) {
          to_close.push_back(std::move(connection));
        }
      }
    }
    backends_.clear();
  }
  return CloseEach(to_close);
}

size_t ConnectionTracker::CloseEach(const std::vector<std::shared_ptr<RoutedConnection>>& connections) {
  for (const auto& connection : connections) {
    connection->Close();
  }
  return connections.size();
}

} // namespace orchestrator::router
