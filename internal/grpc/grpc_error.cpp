#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace orchestrator::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace orchestrator::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const StaleEpoch*>(&e) || dynamic_cast<const InvalidTransition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const VersionMismatch*>(&e) || dynamic_cast<const BackendFailed*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const RouteTimeout*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const SchedulingFailed*>(&e) || dynamic_cast<const PlacementFailed*>(&e) ||
      dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace orchestrator::grpc
