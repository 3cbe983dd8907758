#pragma once

namespace orchestrator::db::sql {

/*
  Canonical SQL used by the SQLite backend. Postgres prepares the same
  statements with $N placeholders in pg_pool.cpp.

  Live states (Scheduled, Loading, Ready, Draining) are stored as 1..4; the
  partial unique index over them is what enforces one live backend per key.
*/

// backends

static constexpr const char* INSERT_BACKEND =
    "INSERT INTO backends(id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BACKEND =
    "SELECT id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause"
    " FROM backends WHERE id=?;";

static constexpr const char* SELECT_LIVE_BACKEND_BY_KEY =
    "SELECT id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause"
    " FROM backends WHERE key=? AND state IN (1,2,3,4);";

static constexpr const char* SELECT_BACKENDS =
    "SELECT id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause"
    " FROM backends ORDER BY id;";

static constexpr const char* SELECT_LIVE_BACKENDS =
    "SELECT id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause"
    " FROM backends WHERE state IN (1,2,3,4) ORDER BY id;";

static constexpr const char* SELECT_BACKENDS_BY_WORKER =
    "SELECT id,key,state,worker_id,address,version,created_at_ms,last_state_change_at_ms,cause"
    " FROM backends WHERE worker_id=? ORDER BY id;";

static constexpr const char* UPDATE_BACKEND_IF_VERSION =
    "UPDATE backends SET state=?,address=?,version=?,last_state_change_at_ms=?,cause=?"
    " WHERE id=? AND version=?;";

static constexpr const char* SELECT_PURGEABLE_BACKENDS =
    "SELECT id FROM backends WHERE state IN (5,6,7) AND last_state_change_at_ms<?;";

static constexpr const char* DELETE_BACKEND = "DELETE FROM backends WHERE id=?;";

// workers

static constexpr const char* UPSERT_WORKER =
    "INSERT INTO workers(id,status,address,epoch,capacity_hint,last_heartbeat_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " status=excluded.status,"
    " address=excluded.address,"
    " epoch=excluded.epoch,"
    " capacity_hint=excluded.capacity_hint,"
    " last_heartbeat_at_ms=excluded.last_heartbeat_at_ms,"
    " version=excluded.version;";

static constexpr const char* SELECT_WORKER =
    "SELECT id,status,address,epoch,capacity_hint,last_heartbeat_at_ms,version FROM workers WHERE id=?;";

static constexpr const char* SELECT_WORKERS =
    "SELECT id,status,address,epoch,capacity_hint,last_heartbeat_at_ms,version FROM workers ORDER BY id;";

// leases

static constexpr const char* UPSERT_LEASE =
    "INSERT INTO leases(backend_id,worker_id,worker_epoch,expires_at_ms,active)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(backend_id) DO UPDATE SET"
    " worker_id=excluded.worker_id,"
    " worker_epoch=excluded.worker_epoch,"
    " expires_at_ms=excluded.expires_at_ms,"
    " active=excluded.active;";

static constexpr const char* SELECT_LEASE =
    "SELECT backend_id,worker_id,worker_epoch,expires_at_ms,active FROM leases WHERE backend_id=?;";

static constexpr const char* RENEW_LEASES =
    "UPDATE leases SET expires_at_ms=MAX(expires_at_ms,?)"
    " WHERE worker_id=? AND worker_epoch=? AND active=1;";

static constexpr const char* SELECT_EXPIRED_LEASES =
    "SELECT backend_id,worker_id,worker_epoch,expires_at_ms,active FROM leases"
    " WHERE active=1 AND expires_at_ms<=? ORDER BY expires_at_ms;";

static constexpr const char* DELETE_LEASE = "DELETE FROM leases WHERE backend_id=?;";

// transition log

static constexpr const char* INSERT_TRANSITION =
    "INSERT INTO transition_log(backend_id,from_state,to_state,version,at_ms,cause)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_TRANSITIONS =
    "SELECT sequence,backend_id,from_state,to_state,version,at_ms,cause"
    " FROM transition_log WHERE backend_id=? ORDER BY version, sequence;";

static constexpr const char* DELETE_TRANSITIONS = "DELETE FROM transition_log WHERE backend_id=?;";

}
