#pragma once

#include <cstdint>

#include "internal/db/model/backend_record.hpp"
#include "internal/db/model/transition_record.hpp"
#include "internal/db/model/worker_record.hpp"
#include "orchestrator/v1/types.pb.h"

namespace orchestrator::service {

orchestrator::v1::BackendState ToProto(orchestrator::model::BackendState state);
orchestrator::v1::WorkerStatus ToProto(orchestrator::model::WorkerStatus status);

orchestrator::v1::Backend         ToProto(const orchestrator::db::model::BackendRecord& record);
orchestrator::v1::Worker          ToProto(const orchestrator::db::model::WorkerRecord& record, uint32_t live_backends);
orchestrator::v1::TransitionEntry ToProto(const orchestrator::db::model::TransitionRecord& record);

} // namespace orchestrator::service
