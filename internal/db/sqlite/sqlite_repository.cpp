#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace orchestrator::db::sqlite {

using orchestrator::db::ErrorCode;
using orchestrator::db::Result;
using orchestrator::model::BackendState;
using orchestrator::model::WorkerStatus;

namespace {

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            st_ = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const { return st_ != nullptr; }
    sqlite3_stmt* get() const { return st_; }

    // Reads cannot return a Result, so they surface driver failures as exceptions.
    sqlite3_stmt* OrThrow() const {
        if (!st_) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
        return st_;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Column order of the SELECT_*BACKEND* queries.
model::BackendRecord ReadBackend(sqlite3_stmt* st) {
    model::BackendRecord r;
    r.id = ColText(st, 0);
    r.key = ColText(st, 1);
    r.state = static_cast<BackendState>(ColI32(st, 2));
    r.worker_id = ColText(st, 3);
    r.address = ColText(st, 4);
    r.version = ColU64(st, 5);
    r.created_at_ms = ColU64(st, 6);
    r.last_state_change_at_ms = ColU64(st, 7);
    r.cause = ColText(st, 8);
    return r;
}

model::WorkerRecord ReadWorker(sqlite3_stmt* st) {
    model::WorkerRecord r;
    r.id = ColText(st, 0);
    r.status = static_cast<WorkerStatus>(ColI32(st, 1));
    r.address = ColText(st, 2);
    r.epoch = ColU64(st, 3);
    r.capacity_hint = static_cast<uint32_t>(ColU64(st, 4));
    r.last_heartbeat_at_ms = ColU64(st, 5);
    r.version = ColU64(st, 6);
    return r;
}

model::LeaseRecord ReadLease(sqlite3_stmt* st) {
    model::LeaseRecord r;
    r.backend_id = ColText(st, 0);
    r.worker_id = ColText(st, 1);
    r.worker_epoch = ColU64(st, 2);
    r.expires_at_ms = ColU64(st, 3);
    r.active = ColI32(st, 4) != 0;
    return r;
}

model::TransitionRecord ReadTransition(sqlite3_stmt* st) {
    model::TransitionRecord r;
    r.sequence = ColU64(st, 0);
    r.backend_id = ColText(st, 1);
    r.from_state = static_cast<BackendState>(ColI32(st, 2));
    r.to_state = static_cast<BackendState>(ColI32(st, 3));
    r.version = ColU64(st, 4);
    r.at_ms = ColU64(st, 5);
    r.cause = ColText(st, 6);
    return r;
}

[[noreturn]] void ThrowStep(sqlite3* db, int rc) {
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
        throw db::TransientError(std::string("sqlite busy: ") + sqlite3_errmsg(db));
    }
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

template <typename Reader>
auto StepAll(sqlite3* db, sqlite3_stmt* st, Reader read) {
    std::vector<decltype(read(st))> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(read(st));
    }
    if (rc != SQLITE_DONE) ThrowStep(db, rc);
    return out;
}

template <typename Reader>
auto StepOne(sqlite3* db, sqlite3_stmt* st, Reader read) -> std::optional<decltype(read(st))> {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return read(st);
    if (rc != SQLITE_DONE) ThrowStep(db, rc);
    return std::nullopt;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Backends
// ------------------------------------------------------------------

Result SqliteRepository::InsertBackend(Transaction& t, const model::BackendRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_BACKEND);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.key);
    BindI32(st.get(), 3, static_cast<int>(r.state));
    BindText(st.get(), 4, r.worker_id);
    BindText(st.get(), 5, r.address);
    BindU64(st.get(), 6, r.version);
    BindU64(st.get(), 7, r.created_at_ms);
    BindU64(st.get(), 8, r.last_state_change_at_ms);
    BindText(st.get(), 9, r.cause);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BackendRecord>
SqliteRepository::GetBackend(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_BACKEND);
    BindText(st.OrThrow(), 1, id);
    return StepOne(db, st.get(), ReadBackend);
}

std::optional<model::BackendRecord>
SqliteRepository::GetLiveBackendByKey(Transaction& t, const std::string& key) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_LIVE_BACKEND_BY_KEY);
    BindText(st.OrThrow(), 1, key);
    return StepOne(db, st.get(), ReadBackend);
}

std::vector<model::BackendRecord> SqliteRepository::ListBackends(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_BACKENDS);
    return StepAll(db, st.OrThrow(), ReadBackend);
}

std::vector<model::BackendRecord> SqliteRepository::ListLiveBackends(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_LIVE_BACKENDS);
    return StepAll(db, st.OrThrow(), ReadBackend);
}

std::vector<model::BackendRecord>
SqliteRepository::ListBackendsByWorker(Transaction& t, const std::string& worker_id) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_BACKENDS_BY_WORKER);
    BindText(st.OrThrow(), 1, worker_id);
    return StepAll(db, st.get(), ReadBackend);
}

Result SqliteRepository::UpdateBackendIfVersion(Transaction& t, const model::BackendRecord& r,
                                                uint64_t expected_version) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_BACKEND_IF_VERSION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.state));
    BindText(st.get(), 2, r.address);
    BindU64(st.get(), 3, r.version);
    BindU64(st.get(), 4, r.last_state_change_at_ms);
    BindText(st.get(), 5, r.cause);
    BindText(st.get(), 6, r.id);
    BindU64(st.get(), 7, expected_version);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;

    if (sqlite3_changes(db) == 0) {
        // Zero rows: either the row is gone or its version moved on.
        if (!GetBackend(t, r.id)) return Result::Err(ErrorCode::NotFound, "backend not found");
        return Result::Err(ErrorCode::Conflict, "backend version changed");
    }
    return Result::Ok();
}

Result SqliteRepository::PurgeTerminalBackends(Transaction& t, uint64_t cutoff_ms, uint64_t& purged) {
    auto* db = TX(t).Handle();
    purged = 0;

    std::vector<std::string> ids;
    {
        Statement st(db, sql::SELECT_PURGEABLE_BACKENDS);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindU64(st.get(), 1, cutoff_ms);
        int rc;
        while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
            ids.push_back(ColText(st.get(), 0));
        }
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    for (const auto& id : ids) {
        for (const char* q : {sql::DELETE_TRANSITIONS, sql::DELETE_LEASE, sql::DELETE_BACKEND}) {
            Statement st(db, q);
            if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
            BindText(st.get(), 1, id);
            auto res = Translate(db, sqlite3_step(st.get()));
            if (!res) return res;
        }
        ++purged;
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_WORKER);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindI32(st.get(), 2, static_cast<int>(r.status));
    BindText(st.get(), 3, r.address);
    BindU64(st.get(), 4, r.epoch);
    BindU64(st.get(), 5, r.capacity_hint);
    BindU64(st.get(), 6, r.last_heartbeat_at_ms);
    BindU64(st.get(), 7, r.version);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::WorkerRecord> SqliteRepository::GetWorker(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_WORKER);
    BindText(st.OrThrow(), 1, id);
    return StepOne(db, st.get(), ReadWorker);
}

std::vector<model::WorkerRecord> SqliteRepository::ListWorkers(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_WORKERS);
    return StepAll(db, st.OrThrow(), ReadWorker);
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result SqliteRepository::UpsertLease(Transaction& t, const model::LeaseRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_LEASE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.backend_id);
    BindText(st.get(), 2, r.worker_id);
    BindU64(st.get(), 3, r.worker_epoch);
    BindU64(st.get(), 4, r.expires_at_ms);
    BindI32(st.get(), 5, r.active ? 1 : 0);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::LeaseRecord> SqliteRepository::GetLease(Transaction& t, const std::string& backend_id) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_LEASE);
    BindText(st.OrThrow(), 1, backend_id);
    return StepOne(db, st.get(), ReadLease);
}

Result SqliteRepository::RenewLeases(Transaction& t, const std::string& worker_id, uint64_t epoch,
                                     uint64_t expires_at_ms, uint64_t& renewed) {
    auto* db = TX(t).Handle();
    renewed = 0;

    Statement st(db, sql::RENEW_LEASES);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, expires_at_ms);
    BindText(st.get(), 2, worker_id);
    BindU64(st.get(), 3, epoch);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res) renewed = static_cast<uint64_t>(sqlite3_changes(db));
    return res;
}

std::vector<model::LeaseRecord> SqliteRepository::ListExpiredLeases(Transaction& t, uint64_t now_ms) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_EXPIRED_LEASES);
    BindU64(st.OrThrow(), 1, now_ms);
    return StepAll(db, st.get(), ReadLease);
}

// ------------------------------------------------------------------
// Transition log
// ------------------------------------------------------------------

Result SqliteRepository::AppendTransition(Transaction& t, model::TransitionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_TRANSITION);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.backend_id);
    BindI32(st.get(), 2, static_cast<int>(r.from_state));
    BindI32(st.get(), 3, static_cast<int>(r.to_state));
    BindU64(st.get(), 4, r.version);
    BindU64(st.get(), 5, r.at_ms);
    BindText(st.get(), 6, r.cause);

    auto res = Translate(db, sqlite3_step(st.get()));
    if (res) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return res;
}

std::vector<model::TransitionRecord>
SqliteRepository::GetTransitions(Transaction& t, const std::string& backend_id) {
    auto* db = TX(t).Handle();
    Statement st(db, sql::SELECT_TRANSITIONS);
    BindText(st.OrThrow(), 1, backend_id);
    return StepAll(db, st.get(), ReadTransition);
}

} // namespace orchestrator::db::sqlite
