#include "pg_repository.hpp"

#include <cstring>

namespace orchestrator::db::postgres {

using orchestrator::model::BackendState;
using orchestrator::model::WorkerStatus;

namespace {

model::BackendRecord ReadBackend(const pqxx::row& row) {
  model::BackendRecord r;
  r.id                      = row[0].c_str();
  r.key                     = row[1].c_str();
  r.state                   = static_cast<BackendState>(row[2].as<int>());
  r.worker_id               = row[3].c_str();
  r.address                 = row[4].c_str();
  r.version                 = row[5].as<uint64_t>();
  r.created_at_ms           = row[6].as<uint64_t>();
  r.last_state_change_at_ms = row[7].as<uint64_t>();
  r.cause                   = row[8].c_str();
  return r;
}

model::WorkerRecord ReadWorker(const pqxx::row& row) {
  model::WorkerRecord r;
  r.id                   = row[0].c_str();
  r.status               = static_cast<WorkerStatus>(row[1].as<int>());
  r.address              = row[2].c_str();
  r.epoch                = row[3].as<uint64_t>();
  r.capacity_hint        = row[4].as<uint32_t>();
  r.last_heartbeat_at_ms = row[5].as<uint64_t>();
  r.version              = row[6].as<uint64_t>();
  return r;
}

model::LeaseRecord ReadLease(const pqxx::row& row) {
  model::LeaseRecord r;
  r.backend_id    = row[0].c_str();
  r.worker_id     = row[1].c_str();
  r.worker_epoch  = row[2].as<uint64_t>();
  r.expires_at_ms = row[3].as<uint64_t>();
  r.active        = row[4].as<bool>();
  return r;
}

model::TransitionRecord ReadTransition(const pqxx::row& row) {
  model::TransitionRecord r;
  r.sequence   = row[0].as<uint64_t>();
  r.backend_id = row[1].c_str();
  r.from_state = static_cast<BackendState>(row[2].as<int>());
  r.to_state   = static_cast<BackendState>(row[3].as<int>());
  r.version    = row[4].as<uint64_t>();
  r.at_ms      = row[5].as<uint64_t>();
  r.cause      = row[6].c_str();
  return r;
}

// Reads cannot return a Result; an aborted serializable transaction is
// surfaced as TransientError so the caller retries it.
template <typename Fn>
auto Guarded(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::serialization_failure& e) {
    throw db::TransientError(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw db::TransientError(e.what());
  }
}

template <typename Reader>
auto ReadAll(const pqxx::result& res, Reader read) {
  std::vector<decltype(read(res[0]))> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    // The primary key and the live-key index both raise unique_violation.
    if (std::strstr(e.what(), "backends_pkey")) return Result::Err(ErrorCode::AlreadyExists, e.what());
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Backends
// ------------------------------------------------------------------

Result PgRepository::InsertBackend(Transaction& t, const model::BackendRecord& r) {
  try {
    TX(t).W().exec_prepared("insert_backend", r.id, r.key, static_cast<int>(r.state), r.worker_id, r.address,
                            r.version, r.created_at_ms, r.last_state_change_at_ms, r.cause);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BackendRecord> PgRepository::GetBackend(Transaction& t, const std::string& id) {
  auto res = Guarded([&] { return TX(t).W().exec_prepared("get_backend", id); });
  if (res.empty()) return std::nullopt;
  return ReadBackend(res[0]);
}

std::optional<model::BackendRecord> PgRepository::GetLiveBackendByKey(Transaction& t, const std::string& key) {
  auto res = Guarded([&] { return TX(t).W().exec_prepared("get_live_backend_by_key", key); });
  if (res.empty()) return std::nullopt;
  return ReadBackend(res[0]);
}

std::vector<model::BackendRecord> PgRepository::ListBackends(Transaction& t) {
  return ReadAll(Guarded([&] { return TX(t).W().exec_prepared("list_backends"); }), ReadBackend);
}

std::vector<model::BackendRecord> PgRepository::ListLiveBackends(Transaction& t) {
  return ReadAll(Guarded([&] { return TX(t).W().exec_prepared("list_live_backends"); }), ReadBackend);
}

std::vector<model::BackendRecord> PgRepository::ListBackendsByWorker(Transaction& t, const std::string& worker_id) {
  return ReadAll(Guarded([&] { return TX(t).W().exec_prepared("list_backends_by_worker", worker_id); }), ReadBackend);
}

Result PgRepository::UpdateBackendIfVersion(Transaction& t, const model::BackendRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).W().exec_prepared("update_backend_if_version", r.id, static_cast<int>(r.state), r.address,
                                       r.version, r.last_state_change_at_ms, r.cause, expected_version);
    if (res.affected_rows() == 0) {
      if (!GetBackend(t, r.id)) return Result::Err(ErrorCode::NotFound, "backend not found");
      return Result::Err(ErrorCode::Conflict, "backend version changed");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::PurgeTerminalBackends(Transaction& t, uint64_t cutoff_ms, uint64_t& purged) {
  purged = 0;
  try {
    // leases go with the backend row through ON DELETE CASCADE
    auto res = TX(t).W().exec_prepared("purge_terminal_backends", cutoff_ms);
    for (const auto& row : res) {
      TX(t).W().exec_prepared("delete_transitions_for", row[0].c_str());
    }
    purged = res.size();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result PgRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
  try {
    TX(t).W().exec_prepared("upsert_worker", r.id, static_cast<int>(r.status), r.address, r.epoch, r.capacity_hint,
                            r.last_heartbeat_at_ms, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkerRecord> PgRepository::GetWorker(Transaction& t, const std::string& id) {
  auto res = Guarded([&] { return TX(t).W().exec_prepared("get_worker", id); });
  if (res.empty()) return std::nullopt;
  return ReadWorker(res[0]);
}

std::vector<model::WorkerRecord> PgRepository::ListWorkers(Transaction& t) {
  return ReadAll(Guarded([&] { return TX(t).W().exec_prepared("list_workers"); }), ReadWorker);
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result PgRepository::UpsertLease(Transaction& t, const model::LeaseRecord& r) {
  try {
    TX(t).W().exec_prepared("upsert_lease", r.backend_id, r.worker_id, r.worker_epoch, r.expires_at_ms, r.active);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LeaseRecord> PgRepository::GetLease(Transaction& t, const std::string& backend_id) {
  auto res = Guarded([&] { return TX(t).W().exec_prepared("get_lease", backend_id); });
  if (res.empty()) return std::nullopt;
  return ReadLease(res[0]);
}

Result PgRepository::RenewLeases(Transaction& t, const std::string& worker_id, uint64_t epoch, uint64_t expires_at_ms,
                                 uint64_t& renewed) {
  renewed = 0;
  try {
    auto res = TX(t).W().exec_prepared("renew_leases", worker_id, epoch, expires_at_ms);
    renewed  = res.affected_rows();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::LeaseRecord> PgRepository::ListExpiredLeases(Transaction& t, uint64_t now_ms) {
  return ReadAll(Guarded([&] { return TX(t).W().exec_prepared("list_expired_leases", now_ms); }), ReadLease);
}

// ------------------------------------------------------------------
// Transition log
// ------------------------------------------------------------------

Result PgRepository::AppendTransition(Transaction& t, model::TransitionRecord& r) {
  try {
    auto res = TX(t).W().exec_prepared("append_transition", r.backend_id, static_cast<int>(r.from_state),
                                       static_cast<int>(r.to_state), r.version, r.at_ms, r.cause);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TransitionRecord> PgRepository::GetTransitions(Transaction& t, const std::string& backend_id) {
  return ReadAll(Guarded([&] { return TX(t).W().exec_prepared("get_transitions", backend_id); }), ReadTransition);
}

} // namespace orchestrator::db::postgres
