#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace orchestrator::util {

using google::protobuf::util::TimeUtil;

uint64_t NowMillis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  return TimeUtil::MillisecondsToTimestamp(static_cast<int64_t>(unix_ms));
}

std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = TimeUtil::DurationToMilliseconds(d);
  return ms > 0 ? std::chrono::milliseconds(ms) : fallback;
}

google::protobuf::Duration ToProto(std::chrono::milliseconds d) {
  return TimeUtil::MillisecondsToDuration(d.count());
}

} // namespace orchestrator::util
