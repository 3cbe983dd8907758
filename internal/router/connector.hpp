#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace orchestrator::router {

/*
  One byte stream to a backend.

  Close() may be called from any thread while another thread is blocked in
  Read/Write on the same stream; it unblocks them. The descriptor itself is
  released by the destructor.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  // -1 when the stream is not backed by a descriptor.
  virtual int Fd() const = 0;

  virtual void Close() = 0;

  virtual bool Closed() const = 0;
};

class Connector {
 public:
  virtual ~Connector() = default;

  // Throws util::Unavailable when `address` cannot be reached in time.
  virtual std::unique_ptr<Connection> Dial(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

class TcpConnection final : public Connection {
 public:
  explicit TcpConnection(int fd);
  ~TcpConnection() override;

  TcpConnection(const TcpConnection&)            = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;

  int  Fd() const override;
  void Close() override;
  bool Closed() const override;

 private:
  int               fd_;
  std::atomic<bool> closed_{false};
};

// Dials host:port with a non-blocking connect bounded by the timeout.
class TcpConnector final : public Connector {
 public:
  std::unique_ptr<Connection> Dial(const std::string& address, std::chrono::milliseconds timeout) override;
};

// Splits "host:port"; brackets around IPv6 hosts are stripped.
// Throws std::invalid_argument.
std::pair<std::string, std::string> SplitHostPort(const std::string& address);

} // namespace orchestrator::router
