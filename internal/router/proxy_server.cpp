#include "proxy_server.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "connector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "router.hpp"

namespace orchestrator::router {

using observability::IntField;
using observability::StringField;

namespace {

constexpr size_t kPumpBufferBytes = 16 * 1024;

bool WriteAll(int fd, const char* data, size_t size) {
  while (size > 0) {
    const ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

// Reads up to the first '\n'. Bytes past it are returned in `rest`.
bool ReadPreamble(int fd, size_t limit, std::string& line, std::string& rest) {
  std::string buffer;
  std::array<char, 512> chunk{};
  while (buffer.size() < limit) {
    const ssize_t n = ::recv(fd, chunk.data(), chunk.size(), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    buffer.append(chunk.data(), static_cast<size_t>(n));

    const auto newline = buffer.find('\n');
    if (newline != std::string::npos) {
      if (newline + 1 > limit) return false;
      line = buffer.substr(0, newline);
      rest = buffer.substr(newline + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      return true;
    }
  }
  return false;
}

bool PeerHungUp(int fd) {
  pollfd pfd{fd, POLLRDHUP, 0};
  if (::poll(&pfd, 1, 0) <= 0) {
    return false;
  }
  return (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0;
}

// Copies bytes both ways until both directions reach EOF or either side
// errors. A peer's half-close is propagated with shutdown(SHUT_WR). A backend
// stream the router force-closed ends the client connection in both
// directions.
void Pump(int client, const Connection& stream) {
  const int                          backend = stream.Fd();
  std::array<char, kPumpBufferBytes> buffer{};
  bool client_open  = true;
  bool backend_open = true;

  while (client_open || backend_open) {
    pollfd fds[2] = {{client, static_cast<short>(client_open ? POLLIN : 0), 0},
                     {backend, static_cast<short>(backend_open ? POLLIN : 0), 0}};
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      return;
    }

    for (int i = 0; i < 2; ++i) {
      if (fds[i].revents == 0) continue;
      const int from = i == 0 ? client : backend;
      const int to   = i == 0 ? backend : client;

      const ssize_t n = ::recv(from, buffer.data(), buffer.size(), 0);
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0 && i == 1 && stream.Closed()) {
        ::shutdown(client, SHUT_RDWR);
        return;
      }
      if (n < 0) return;
      if (n == 0) {
        (i == 0 ? client_open : backend_open) = false;
        ::shutdown(to, SHUT_WR);
        continue;
      }
      if (!WriteAll(to, buffer.data(), static_cast<size_t>(n))) return;
    }
  }
}

} // namespace

std::string ErrorLine(const std::exception& error) {
  const char* code = "INTERNAL";
  if (dynamic_cast<const util::RouteTimeout*>(&error)) {
    code = "ROUTE_TIMEOUT";
  } else if (dynamic_cast<const util::BackendFailed*>(&error)) {
    code = "BACKEND_FAILED";
  } else if (dynamic_cast<const util::SchedulingFailed*>(&error)) {
    code = "SCHEDULING_FAILED";
  } else if (dynamic_cast<const util::Unavailable*>(&error)) {
    code = "UNAVAILABLE";
  } else if (dynamic_cast<const std::invalid_argument*>(&error)) {
    code = "BAD_REQUEST";
  }

  std::string message = error.what();
  for (auto& c : message) {
    if (c == '\n' || c == '\r') c = ' ';
  }
  return std::string("ERR ") + code + " " + message + "\n";
}

ProxyServer::ProxyServer(std::shared_ptr<Router> router, ProxyOptions options)
    : router_(std::move(router)), options_(std::move(options)) {
  if (!router_) {
    throw std::invalid_argument("proxy requires a router");
  }
}

ProxyServer::~ProxyServer() {
  Stop();
}

void ProxyServer::Start() {
  if (running_) {
    return;
  }

  const auto [host, port] = SplitHostPort(options_.bind_address);

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags    = AI_PASSIVE;

  addrinfo* result = nullptr;
  if (int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &result); rc != 0) {
    throw std::runtime_error("proxy bind address " + options_.bind_address + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(result, &::freeaddrinfo);

  int fd = ::socket(result->ai_family, result->ai_socktype | SOCK_CLOEXEC, result->ai_protocol);
  if (fd < 0) {
    throw std::runtime_error(std::string("proxy socket: ") + std::strerror(errno));
  }
  const int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  if (::bind(fd, result->ai_addr, result->ai_addrlen) != 0 || ::listen(fd, SOMAXCONN) != 0) {
    const std::string error = std::strerror(errno);
    ::close(fd);
    throw std::runtime_error("proxy listen on " + options_.bind_address + ": " + error);
  }

  sockaddr_storage bound{};
  socklen_t        bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    port_ = bound.ss_family == AF_INET6 ? ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port)
                                        : ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
  }

  listen_fd_ = fd;
  running_   = true;
  acceptor_  = std::thread([this] { AcceptLoop(); });

  ORCHESTRATOR_LOG_INFO("proxy listening", {StringField("address", options_.bind_address), IntField("port", port_)});
}

void ProxyServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  ::shutdown(listen_fd_, SHUT_RDWR);
  if (acceptor_.joinable()) {
    acceptor_.join();
  }
  ::close(listen_fd_);
  listen_fd_ = -1;

  std::list<std::unique_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (auto& session : sessions) {
    ::shutdown(session->fd, SHUT_RDWR);
  }
  for (auto& session : sessions) {
    if (session->thread.joinable()) {
      session->thread.join();
    }
    ::close(session->fd);
  }
}

size_t ProxyServer::ActiveSessions() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  size_t active = 0;
  for (const auto& session : sessions_) {
    if (!session->done) ++active;
  }
  return active;
}

void ProxyServer::ReapFinished() {
  std::list<std::unique_ptr<Session>> finished;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if ((*it)->done) {
        finished.push_back(std::move(*it));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& session : finished) {
    session->thread.join();
    ::close(session->fd);
  }
}

void ProxyServer::AcceptLoop() {
  while (running_) {
    const int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
      if (errno == EINTR || errno == ECONNABORTED) continue;
      if (running_) {
        ORCHESTRATOR_LOG_ERROR("proxy accept failed", {StringField("error", std::strerror(errno))});
      }
      return;
    }

    ReapFinished();

    auto  session = std::make_unique<Session>();
    auto* raw     = session.get();
    raw->fd       = client;
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.push_back(std::move(session));
    raw->thread = std::thread([this, raw] { Serve(*raw); });
  }
}

void ProxyServer::Serve(Session& session) {
  const int   client = session.fd;
  std::string key;
  std::string rest;

  if (!ReadPreamble(client, options_.max_preamble_bytes, key, rest) || key.empty()) {
    const std::string line = ErrorLine(std::invalid_argument("expected routing key line"));
    WriteAll(client, line.data(), line.size());
    session.done = true;
    return;
  }

  CancellationToken cancel([client] { return PeerHungUp(client); });
  std::shared_ptr<RoutedConnection> connection;
  try {
    connection = router_->Route(key, &cancel);
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_WARN("route failed", {StringField("key", key), StringField("error", e.what())});
    const std::string line = ErrorLine(e);
    WriteAll(client, line.data(), line.size());
    session.done = true;
    return;
  }

  const int backend = connection->Stream().Fd();
  if (backend >= 0 && (rest.empty() || WriteAll(backend, rest.data(), rest.size()))) {
    Pump(client, connection->Stream());
  }
  connection.reset();
  session.done = true;
}

} // namespace orchestrator::router
