#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace orchestrator::grpc {

/*
  Status for an exception escaping a service handler:

    NotFound                              NOT_FOUND
    std::invalid_argument                 INVALID_ARGUMENT
    StaleEpoch, InvalidTransition         FAILED_PRECONDITION
    VersionMismatch, BackendFailed        ABORTED
    RouteTimeout                          DEADLINE_EXCEEDED
    SchedulingFailed, PlacementFailed,
    Unavailable                           UNAVAILABLE
    anything else                         INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace orchestrator::grpc
