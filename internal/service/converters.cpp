#include "converters.hpp"

#include "internal/util/time.hpp"

namespace orchestrator::service {

using namespace orchestrator::v1;
using orchestrator::util::MillisToProto;

// Enum values are shared with the proto definitions.
BackendState ToProto(orchestrator::model::BackendState state) {
  return static_cast<BackendState>(static_cast<int>(state));
}

WorkerStatus ToProto(orchestrator::model::WorkerStatus status) {
  return static_cast<WorkerStatus>(static_cast<int>(status));
}

Backend ToProto(const orchestrator::db::model::BackendRecord& record) {
  Backend backend;
  backend.set_id(record.id);
  backend.set_key(record.key);
  backend.set_state(ToProto(record.state));
  backend.set_worker_id(record.worker_id);
  backend.set_address(record.address);
  backend.set_version(record.version);
  *backend.mutable_created_at()           = MillisToProto(record.created_at_ms);
  *backend.mutable_last_state_change_at() = MillisToProto(record.last_state_change_at_ms);
  backend.set_cause(record.cause);
  return backend;
}

Worker ToProto(const orchestrator::db::model::WorkerRecord& record, uint32_t live_backends) {
  Worker worker;
  worker.set_id(record.id);
  worker.set_status(ToProto(record.status));
  worker.set_address(record.address);
  worker.set_epoch(record.epoch);
  worker.set_capacity_hint(record.capacity_hint);
  *worker.mutable_last_heartbeat_at() = MillisToProto(record.last_heartbeat_at_ms);
  worker.set_live_backends(live_backends);
  return worker;
}

TransitionEntry ToProto(const orchestrator::db::model::TransitionRecord& record) {
  TransitionEntry entry;
  entry.set_sequence(record.sequence);
  entry.set_backend_id(record.backend_id);
  entry.set_from_state(ToProto(record.from_state));
  entry.set_to_state(ToProto(record.to_state));
  entry.set_version(record.version);
  *entry.mutable_at() = MillisToProto(record.at_ms);
  entry.set_cause(record.cause);
  return entry;
}

} // namespace orchestrator::service
