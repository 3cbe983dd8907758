#pragma once

#include <stdexcept>
#include <string>

namespace orchestrator::util {

/*
  Central error types.

  These get translated later to gRPC status codes (internal/grpc/grpc_error)
  and to ERR lines by the proxy.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic concurrency lost a race. Retried internally; only escapes when
// a caller asked for a single compare-and-transition.
class VersionMismatch : public std::runtime_error {
 public:
  explicit VersionMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A worker presented an epoch that has been superseded by re-registration.
class StaleEpoch : public std::runtime_error {
 public:
  explicit StaleEpoch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PlacementFailed : public std::runtime_error {
 public:
  explicit PlacementFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Placement retries exhausted.
class SchedulingFailed : public std::runtime_error {
 public:
  explicit SchedulingFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retryable: a waiting connection exceeded its wait budget.
class RouteTimeout : public std::runtime_error {
 public:
  explicit RouteTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The backend a caller was waiting on reached Failed or Lost.
class BackendFailed : public std::runtime_error {
 public:
  explicit BackendFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retryable: store retries exhausted, key draining, or request cancelled.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace orchestrator::util
