#include "internal/store/state_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace orchestrator::store {

using model::BackendEvent;
using model::BackendState;
using model::Decision;
using model::WorkerStatus;

namespace {

// Raised inside a transaction body when the whole transaction should be retried.
class RetryTransaction : public std::runtime_error {
 public:
  explicit RetryTransaction(const std::string& msg) : std::runtime_error(msg) {
  }
};

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " [" + std::string(db::ToString(result.code)) + "]";
  if (!result.message.empty()) message += ": " + result.message;
  if (db::IsTransient(result.code)) {
    throw RetryTransaction(message);
  }
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

TransitionRecord LogEntry(const BackendRecord& after, BackendState from) {
  TransitionRecord entry;
  entry.backend_id = after.id;
  entry.from_state = from;
  entry.to_state   = after.state;
  entry.version    = after.version;
  entry.at_ms      = after.last_state_change_at_ms;
  entry.cause      = after.cause;
  return entry;
}

StateChange ChangeOf(const BackendRecord& after, BackendState from) {
  return StateChange{after.id, after.key, after.worker_id, after.address, from, after.state, after.version};
}

/*
  Writes `next` over `current` (CAS on current.version), logs the transition
  and retires the lease once the backend is terminal.
*/
void WriteTransition(db::Repository& repo, db::Transaction& tx, const BackendRecord& current, const BackendRecord& next) {
  auto result = repo.UpdateBackendIfVersion(tx, next, current.version);
  if (result.code == db::ErrorCode::Conflict) {
    throw util::VersionMismatch("backend " + current.id + " moved past version " + std::to_string(current.version));
  }
  ThrowIfDbError(result, "update backend");

  auto entry = LogEntry(next, current.state);
  ThrowIfDbError(repo.AppendTransition(tx, entry), "append transition");

  if (model::IsTerminal(next.state)) {
    if (auto lease = repo.GetLease(tx, next.id); lease && lease->active) {
      lease->active = false;
      ThrowIfDbError(repo.UpsertLease(tx, *lease), "invalidate lease");
    }
  }
}

BackendRecord Advance(const BackendRecord& current, BackendState target, const std::string& cause,
                      const std::optional<std::string>& address) {
  BackendRecord next           = current;
  next.state                   = target;
  next.version                 = current.version + 1;
  next.last_state_change_at_ms = std::max(util::NowMillis(), current.last_state_change_at_ms);
  next.cause                   = cause;
  if (address && target == BackendState::kReady) {
    next.address = *address;
  }
  return next;
}

// Runs the transition function against `current` and writes the outcome.
// A lost CAS race is turned into a transaction retry.
ApplyResult ApplyDecided(db::Repository& repo, db::Transaction& tx, const BackendRecord& current, BackendEvent event,
                         const std::string& cause, const std::optional<std::string>& address) {
  const auto decision = model::Decide(current.state, event);
  if (decision.decision == Decision::kNoOp) {
    return ApplyResult{ApplyOutcome::kNoOp, current};
  }
  if (decision.decision == Decision::kReject) {
    return ApplyResult{ApplyOutcome::kRejected, current};
  }

  auto next = Advance(current, decision.next, cause, address);
  try {
    WriteTransition(repo, tx, current, next);
  } catch (const util::VersionMismatch& e) {
    throw RetryTransaction(e.what());
  }
  return ApplyResult{ApplyOutcome::kApplied, next};
}

} // namespace

StateStore::StateStore(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("state store requires a repository");
  }
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

template <typename Fn>
auto StateStore::RunInTransaction(const char* operation, Fn&& fn) {
  auto        backoff = options_.initial_backoff;
  std::string last_error;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto tx     = repository_->Begin();
      auto result = fn(*tx);
      tx->Commit();
      return result;
    } catch (const RetryTransaction& e) {
      last_error = e.what();
    } catch (const db::TransientError& e) {
      last_error = e.what();
    }

    if (attempt >= options_.max_attempts) {
      ORCHESTRATOR_LOG_WARN("store retries exhausted", {observability::StringField("operation", operation),
                                                         observability::IntField("attempts", attempt),
                                                         observability::StringField("error", last_error)});
      throw util::Unavailable(std::string(operation) + ": " + last_error);
    }

    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, options_.max_backoff);
  }
}

// ------------------------------------------------------------------
// Backends
// ------------------------------------------------------------------

ReserveResult StateStore::Reserve(const std::string& key, const std::string& worker_id,
                                  std::chrono::milliseconds lease_duration, const std::string& cause) {
  if (key.empty()) {
    throw std::invalid_argument("backend key must not be empty");
  }

  auto result = RunInTransaction("reserve", [&](db::Transaction& tx) {
    if (auto existing = repository_->GetLiveBackendByKey(tx, key)) {
      return ReserveResult{false, *existing, 0};
    }

    auto worker = repository_->GetWorker(tx, worker_id);
    if (!worker) {
      throw util::NotFound("worker not found: " + worker_id);
    }

    const auto now = util::NowMillis();

    BackendRecord backend;
    backend.id                      = util::NewId();
    backend.key                     = key;
    backend.state                   = BackendState::kScheduled;
    backend.worker_id               = worker_id;
    backend.version                 = 1;
    backend.created_at_ms           = now;
    backend.last_state_change_at_ms = now;
    backend.cause                   = cause;

    auto inserted = repository_->InsertBackend(tx, backend);
    if (inserted.code == db::ErrorCode::ConstraintViolation || inserted.code == db::ErrorCode::AlreadyExists) {
      // Lost the key to a concurrent reserve; the retry reads the winner.
      throw RetryTransaction(inserted.message);
    }
    ThrowIfDbError(inserted, "insert backend");

    LeaseRecord lease;
    lease.backend_id    = backend.id;
    lease.worker_id     = worker_id;
    lease.worker_epoch  = worker->epoch;
    lease.expires_at_ms = now + static_cast<uint64_t>(lease_duration.count());
    lease.active        = true;
    ThrowIfDbError(repository_->UpsertLease(tx, lease), "insert lease");

    auto entry = LogEntry(backend, BackendState::kUnspecified);
    ThrowIfDbError(repository_->AppendTransition(tx, entry), "append transition");

    return ReserveResult{true, backend, worker->epoch};
  });

  if (result.reserved) {
    Publish({ChangeOf(result.backend, BackendState::kUnspecified)});
  }
  return result;
}

uint64_t StateStore::CompareAndTransition(const std::string& id, uint64_t expected_version, BackendState target,
                                          const std::string& cause, const std::optional<std::string>& address) {
  BackendState from = BackendState::kUnspecified;

  auto updated = RunInTransaction("compare_and_transition", [&](db::Transaction& tx) {
    auto current = repository_->GetBackend(tx, id);
    if (!current) {
      throw util::NotFound("backend not found: " + id);
    }
    if (current->version != expected_version) {
      throw util::VersionMismatch("backend " + id + " is at version " + std::to_string(current->version) +
                                  ", expected " + std::to_string(expected_version));
    }
    if (!model::CanTransition(current->state, target)) {
      throw util::InvalidTransition("backend " + id + ": " + std::string(model::ToString(current->state)) + " -> " +
                                    std::string(model::ToString(target)));
    }

    from      = current->state;
    auto next = Advance(*current, target, cause, address);
    WriteTransition(*repository_, tx, *current, next);
    return next;
  });

  Publish({ChangeOf(updated, from)});
  return updated.version;
}

ApplyResult StateStore::ApplyEvent(const std::string& id, BackendEvent event, const std::string& cause,
                                   const std::optional<std::string>& address) {
  BackendState from = BackendState::kUnspecified;

  auto result = RunInTransaction("apply_event", [&](db::Transaction& tx) {
    auto current = repository_->GetBackend(tx, id);
    if (!current) {
      throw util::NotFound("backend not found: " + id);
    }
    from = current->state;
    return ApplyDecided(*repository_, tx, *current, event, cause, address);
  });

  Finish(result, from, event);
  return result;
}

ApplyResult StateStore::ExpireLease(const std::string& backend_id, uint64_t now_ms) {
  BackendState from = BackendState::kUnspecified;

  auto result = RunInTransaction("expire_lease", [&](db::Transaction& tx) {
    auto current = repository_->GetBackend(tx, backend_id);
    if (!current) {
      throw util::NotFound("backend not found: " + backend_id);
    }
    from = current->state;

    // A heartbeat may have renewed the lease since it was listed.
    auto lease = repository_->GetLease(tx, backend_id);
    if (!lease || !lease->active || lease->expires_at_ms > now_ms) {
      return ApplyResult{ApplyOutcome::kNoOp, *current};
    }

    auto applied = ApplyDecided(*repository_, tx, *current, BackendEvent::kLeaseExpired, "lease expired", std::nullopt);
    if (applied.outcome != ApplyOutcome::kApplied) {
      // Nothing left to reclaim; retire the lease so the sweep stops seeing it.
      lease->active = false;
      ThrowIfDbError(repository_->UpsertLease(tx, *lease), "invalidate lease");
    }
    return applied;
  });

  Finish(result, from, BackendEvent::kLeaseExpired);
  return result;
}

void StateStore::Finish(const ApplyResult& result, BackendState from, BackendEvent event) {
  if (result.outcome == ApplyOutcome::kApplied) {
    Publish({ChangeOf(result.backend, from)});
  } else if (result.outcome == ApplyOutcome::kRejected) {
    ORCHESTRATOR_LOG_WARN("transition rejected",
                          {observability::StringField("backend_id", result.backend.id),
                           observability::StateField("state", result.backend.state),
                           observability::StringField("event", model::ToString(event))});
  } else {
    ORCHESTRATOR_LOG_DEBUG("duplicate event ignored", {observability::StringField("backend_id", result.backend.id),
                                                       observability::StringField("event", model::ToString(event))});
  }
}

std::optional<BackendRecord> StateStore::Get(const std::string& id) {
  return RunInTransaction("get", [&](db::Transaction& tx) { return repository_->GetBackend(tx, id); });
}

std::optional<BackendRecord> StateStore::GetByKey(const std::string& key) {
  return RunInTransaction("get_by_key", [&](db::Transaction& tx) { return repository_->GetLiveBackendByKey(tx, key); });
}

std::vector<BackendRecord> StateStore::ListBackends() {
  return RunInTransaction("list_backends", [&](db::Transaction& tx) { return repository_->ListBackends(tx); });
}

std::vector<BackendRecord> StateStore::ListLive() {
  return RunInTransaction("list_live", [&](db::Transaction& tx) { return repository_->ListLiveBackends(tx); });
}

std::vector<BackendRecord> StateStore::ListByWorker(const std::string& worker_id) {
  return RunInTransaction("list_by_worker",
                          [&](db::Transaction& tx) { return repository_->ListBackendsByWorker(tx, worker_id); });
}

// ------------------------------------------------------------------
// Transition log
// ------------------------------------------------------------------

uint64_t StateStore::AppendLogEntry(TransitionRecord entry) {
  return RunInTransaction("append_log_entry", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->AppendTransition(tx, entry), "append transition");
    return entry.sequence;
  });
}

std::vector<TransitionRecord> StateStore::History(const std::string& backend_id) {
  return RunInTransaction("history", [&](db::Transaction& tx) {
    if (!repository_->GetBackend(tx, backend_id)) {
      throw util::NotFound("backend not found: " + backend_id);
    }
    return repository_->GetTransitions(tx, backend_id);
  });
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

WorkerRecord StateStore::RegisterWorker(const std::string& worker_id, const std::string& address, uint32_t capacity_hint) {
  if (worker_id.empty()) {
    throw std::invalid_argument("worker id must not be empty");
  }

  return RunInTransaction("register_worker", [&](db::Transaction& tx) {
    WorkerRecord worker;
    if (auto existing = repository_->GetWorker(tx, worker_id)) {
      worker = *existing;
    } else {
      worker.id = worker_id;
    }

    worker.status               = WorkerStatus::kActive;
    worker.address              = address;
    worker.capacity_hint        = capacity_hint;
    worker.epoch                = worker.epoch + 1;
    worker.last_heartbeat_at_ms = util::NowMillis();
    worker.version              = worker.version + 1;
    ThrowIfDbError(repository_->UpsertWorker(tx, worker), "upsert worker");
    return worker;
  });
}

uint64_t StateStore::Heartbeat(const std::string& worker_id, uint64_t epoch, std::chrono::milliseconds lease_duration) {
  return RunInTransaction("heartbeat", [&](db::Transaction& tx) {
    auto worker = repository_->GetWorker(tx, worker_id);
    if (!worker) {
      throw util::NotFound("worker not found: " + worker_id);
    }
    if (worker->epoch != epoch) {
      throw util::StaleEpoch("worker " + worker_id + " epoch " + std::to_string(epoch) + " superseded by " +
                             std::to_string(worker->epoch));
    }
    if (worker->status == WorkerStatus::kLost) {
      throw util::StaleEpoch("worker " + worker_id + " was declared lost; re-register");
    }

    const auto now               = util::NowMillis();
    worker->last_heartbeat_at_ms = now;
    worker->version += 1;
    ThrowIfDbError(repository_->UpsertWorker(tx, *worker), "upsert worker");

    uint64_t renewed = 0;
    ThrowIfDbError(repository_->RenewLeases(tx, worker_id, epoch, now + static_cast<uint64_t>(lease_duration.count()),
                                            renewed),
                   "renew leases");
    return renewed;
  });
}

void StateStore::SetWorkerStatus(const std::string& worker_id, WorkerStatus status) {
  RunInTransaction("set_worker_status", [&](db::Transaction& tx) {
    auto worker = repository_->GetWorker(tx, worker_id);
    if (!worker) {
      throw util::NotFound("worker not found: " + worker_id);
    }
    if (worker->status == status) {
      return false;
    }
    worker->status = status;
    worker->version += 1;
    ThrowIfDbError(repository_->UpsertWorker(tx, *worker), "upsert worker");
    return true;
  });
}

std::optional<WorkerRecord> StateStore::MarkWorkerLostIfSilent(const std::string& worker_id, uint64_t now_ms,
                                                               std::chrono::milliseconds silence) {
  return RunInTransaction("mark_worker_lost", [&](db::Transaction& tx) -> std::optional<WorkerRecord> {
    auto worker = repository_->GetWorker(tx, worker_id);
    if (!worker || worker->status == WorkerStatus::kLost) {
      return std::nullopt;
    }
    if (worker->last_heartbeat_at_ms + static_cast<uint64_t>(silence.count()) >= now_ms) {
      return std::nullopt;
    }

    auto lost    = *worker;
    lost.status  = WorkerStatus::kLost;
    lost.version += 1;
    ThrowIfDbError(repository_->UpsertWorker(tx, lost), "upsert worker");
    return worker;
  });
}

std::vector<WorkerRecord> StateStore::ListWorkers() {
  return RunInTransaction("list_workers", [&](db::Transaction& tx) { return repository_->ListWorkers(tx); });
}

std::optional<WorkerRecord> StateStore::GetWorker(const std::string& worker_id) {
  return RunInTransaction("get_worker", [&](db::Transaction& tx) { return repository_->GetWorker(tx, worker_id); });
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

uint64_t StateStore::RenewLeases(const std::string& worker_id, uint64_t epoch, uint64_t until_ms) {
  return RunInTransaction("renew_leases", [&](db::Transaction& tx) {
    uint64_t renewed = 0;
    ThrowIfDbError(repository_->RenewLeases(tx, worker_id, epoch, until_ms, renewed), "renew leases");
    return renewed;
  });
}

std::vector<LeaseRecord> StateStore::ExpiredLeases(uint64_t now_ms) {
  return RunInTransaction("expired_leases", [&](db::Transaction& tx) { return repository_->ListExpiredLeases(tx, now_ms); });
}

std::optional<LeaseRecord> StateStore::GetLease(const std::string& backend_id) {
  return RunInTransaction("get_lease", [&](db::Transaction& tx) { return repository_->GetLease(tx, backend_id); });
}

bool StateStore::InvalidateLease(const std::string& backend_id) {
  return RunInTransaction("invalidate_lease", [&](db::Transaction& tx) {
    auto lease = repository_->GetLease(tx, backend_id);
    if (!lease || !lease->active) {
      return false;
    }
    lease->active = false;
    ThrowIfDbError(repository_->UpsertLease(tx, *lease), "invalidate lease");
    return true;
  });
}

// ------------------------------------------------------------------
// Notifications and retention
// ------------------------------------------------------------------

uint64_t StateStore::Subscribe(StateListener listener) {
  std::lock_guard lock(listeners_mutex_);
  const auto      id = next_subscription_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void StateStore::Unsubscribe(uint64_t subscription) {
  std::lock_guard lock(listeners_mutex_);
  std::erase_if(listeners_, [subscription](const auto& entry) { return entry.first == subscription; });
}

void StateStore::Publish(const std::vector<StateChange>& changes) {
  std::vector<StateListener> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [_, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }

  for (const auto& change : changes) {
    ORCHESTRATOR_LOG_INFO("backend transition", {observability::StringField("backend_id", change.backend_id),
                                                  observability::StringField("key", change.key),
                                                  observability::StateField("from", change.from),
                                                  observability::StateField("to", change.to),
                                                  observability::IntField("version", static_cast<int64_t>(change.version))});
    observability::Metrics::Instance().RecordTransition(model::ToString(change.to));
    for (const auto& listener : listeners) {
      listener(change);
    }
  }
}

uint64_t StateStore::PurgeTerminal(uint64_t before_ms) {
  return RunInTransaction("purge_terminal", [&](db::Transaction& tx) {
    uint64_t purged = 0;
    ThrowIfDbError(repository_->PurgeTerminalBackends(tx, before_ms, purged), "purge terminal backends");
    return purged;
  });
}

} // namespace orchestrator::store
