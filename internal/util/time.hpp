#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace orchestrator::util {

/*
  Persisted timestamps (created_at, lease expiry, heartbeats) are unix
  milliseconds from the wall clock. In-process waits use steady_clock
  directly and never go through here.
*/

uint64_t NowMillis();

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

// Zero or unset durations resolve to `fallback`.
std::chrono::milliseconds  DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);
google::protobuf::Duration ToProto(std::chrono::milliseconds d);

} // namespace orchestrator::util
