#include "connector.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace orchestrator::router {

namespace {

std::string SocketError(const std::string& context) {
  return context + ": " + std::strerror(errno);
}

// Returns 0 on success, otherwise the errno of the failed connect.
int ConnectWithin(int fd, const addrinfo& ai, std::chrono::milliseconds timeout) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return errno;
  }

  int rc = ::connect(fd, ai.ai_addr, ai.ai_addrlen);
  if (rc != 0 && errno != EINPROGRESS) {
    return errno;
  }

  if (rc != 0) {
    pollfd pfd{fd, POLLOUT, 0};
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc == 0) {
      return ETIMEDOUT;
    }
    if (rc < 0) {
      return errno;
    }
    int       err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
      return errno;
    }
    if (err != 0) {
      return err;
    }
  }

  // Back to blocking for the pump.
  if (::fcntl(fd, F_SETFL, flags) < 0) {
    return errno;
  }
  return 0;
}

} // namespace

std::pair<std::string, std::string> SplitHostPort(const std::string& address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw std::invalid_argument("address must be host:port: " + address);
  }
  std::string host = address.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  return {host, address.substr(colon + 1)};
}

TcpConnection::TcpConnection(int fd) : fd_(fd) {
}

TcpConnection::~TcpConnection() {
  Close();
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

int TcpConnection::Fd() const {
  return fd_;
}

void TcpConnection::Close() {
  if (!closed_.exchange(true) && fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

bool TcpConnection::Closed() const {
  return closed_.load();
}

std::unique_ptr<Connection> TcpConnector::Dial(const std::string& address, std::chrono::milliseconds timeout) {
  std::pair<std::string, std::string> host_port;
  try {
    host_port = SplitHostPort(address);
  } catch (const std::invalid_argument& e) {
    throw util::Unavailable(e.what());
  }

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  if (int rc = ::getaddrinfo(host_port.first.c_str(), host_port.second.c_str(), &hints, &result); rc != 0) {
    throw util::Unavailable("resolve " + address + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(result, &::freeaddrinfo);

  std::string last_error = "no addresses for " + address;
  for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_error = SocketError("socket");
      continue;
    }
    if (int err = ConnectWithin(fd, *ai, timeout); err != 0) {
      last_error = "connect " + address + ": " + std::strerror(err);
      ::close(fd);
      continue;
    }
    return std::make_unique<TcpConnection>(fd);
  }

  throw util::Unavailable(last_error);
}

} // namespace orchestrator::router
