#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace orchestrator::db::memory {

using orchestrator::model::IsLive;
using orchestrator::model::IsTerminal;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Backends
// ------------------------------------------------------------------

Result MemoryRepository::InsertBackend(Transaction& t, const model::BackendRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.backends.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "backend id already exists");
  if (IsLive(r.state)) {
    if (s.live_by_key.contains(r.key)) {
      return Result::Err(ErrorCode::ConstraintViolation, "live backend already holds key");
    }
    s.live_by_key[r.key] = r.id;
  }
  s.backends[r.id] = r;
  return Result::Ok();
}

std::optional<model::BackendRecord> MemoryRepository::GetBackend(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.backends.find(id);
  if (it == s.backends.end()) return std::nullopt;
  return it->second;
}

std::optional<model::BackendRecord> MemoryRepository::GetLiveBackendByKey(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.live_by_key.find(key);
  if (it == s.live_by_key.end()) return std::nullopt;
  return s.backends.at(it->second);
}

std::vector<model::BackendRecord> MemoryRepository::ListBackends(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::BackendRecord> out;
  out.reserve(s.backends.size());
  for (const auto& [_, record] : s.backends) {
    out.push_back(record);
  }
  return out;
}

std::vector<model::BackendRecord> MemoryRepository::ListLiveBackends(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::BackendRecord> out;
  out.reserve(s.live_by_key.size());
  for (const auto& [_, record] : s.backends) {
    if (IsLive(record.state)) out.push_back(record);
  }
  return out;
}

std::vector<model::BackendRecord> MemoryRepository::ListBackendsByWorker(Transaction& t, const std::string& worker_id) {
  std::vector<model::BackendRecord> out;
  for (const auto& [_, record] : TX(t).View().backends) {
    if (record.worker_id == worker_id) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::UpdateBackendIfVersion(Transaction& t, const model::BackendRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.backends.find(r.id);
  if (it == s.backends.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "backend version mismatch");
  }

  const bool was_live = IsLive(it->second.state);
  const bool is_live  = IsLive(r.state);
  if (!was_live && is_live) {
    auto holder = s.live_by_key.find(r.key);
    if (holder != s.live_by_key.end() && holder->second != r.id) {
      return Result::Err(ErrorCode::ConstraintViolation, "live backend already holds key");
    }
    s.live_by_key[r.key] = r.id;
  } else if (was_live && !is_live) {
    s.live_by_key.erase(it->second.key);
  }

  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::PurgeTerminalBackends(Transaction& t, uint64_t cutoff_ms, uint64_t& purged) {
  auto& s = TX(t).Mutable();
  purged  = 0;
  for (auto it = s.backends.begin(); it != s.backends.end();) {
    if (!IsTerminal(it->second.state) || it->second.last_state_change_at_ms >= cutoff_ms) {
      ++it;
      continue;
    }
    const auto id = it->first;
    s.leases.erase(id);
    s.transitions.erase(std::remove_if(s.transitions.begin(), s.transitions.end(),
                                       [&](const model::TransitionRecord& e) { return e.backend_id == id; }),
                        s.transitions.end());
    it = s.backends.erase(it);
    ++purged;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result MemoryRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
  TX(t).Mutable().workers[r.id] = r;
  return Result::Ok();
}

std::optional<model::WorkerRecord> MemoryRepository::GetWorker(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkerRecord> MemoryRepository::ListWorkers(Transaction& t) {
  std::vector<model::WorkerRecord> out;
  for (const auto& [_, record] : TX(t).View().workers) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result MemoryRepository::UpsertLease(Transaction& t, const model::LeaseRecord& r) {
  TX(t).Mutable().leases[r.backend_id] = r;
  return Result::Ok();
}

std::optional<model::LeaseRecord> MemoryRepository::GetLease(Transaction& t, const std::string& backend_id) {
  const auto& s  = TX(t).View();
  auto        it = s.leases.find(backend_id);
  if (it == s.leases.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::RenewLeases(Transaction& t, const std::string& worker_id, uint64_t epoch, uint64_t expires_at_ms,
                                     uint64_t& renewed) {
  renewed = 0;
  for (auto& [_, lease] : TX(t).Mutable().leases) {
    if (lease.active && lease.worker_id == worker_id && lease.worker_epoch == epoch) {
      lease.expires_at_ms = std::max(lease.expires_at_ms, expires_at_ms);
      ++renewed;
    }
  }
  return Result::Ok();
}

std::vector<model::LeaseRecord> MemoryRepository::ListExpiredLeases(Transaction& t, uint64_t now_ms) {
  std::vector<model::LeaseRecord> out;
  for (const auto& [_, lease] : TX(t).View().leases) {
    if (lease.active && lease.expires_at_ms <= now_ms) out.push_back(lease);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.expires_at_ms < b.expires_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Transition log
// ------------------------------------------------------------------

Result MemoryRepository::AppendTransition(Transaction& t, model::TransitionRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.next_sequence++;
  s.transitions.push_back(r);
  return Result::Ok();
}

std::vector<model::TransitionRecord> MemoryRepository::GetTransitions(Transaction& t, const std::string& backend_id) {
  std::vector<model::TransitionRecord> out;
  for (const auto& e : TX(t).View().transitions) {
    if (e.backend_id == backend_id) out.push_back(e);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.version < b.version; });
  return out;
}

} // namespace orchestrator::db::memory
