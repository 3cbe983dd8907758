#pragma once

#include <cstdint>
#include <string>

namespace orchestrator::db::model {

/*
  One lease per backend (backend_id is the primary key). Invalidated leases
  are kept for audit with active=false.
*/
struct LeaseRecord {
  std::string backend_id;
  std::string worker_id;
  uint64_t    worker_epoch  = 0;
  uint64_t    expires_at_ms = 0;
  bool        active        = true;
};

} // namespace orchestrator::db::model
