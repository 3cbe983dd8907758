#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace orchestrator::db {

/*
  Outcome of a single repository call.

  Engines map their native errors (SQLITE_BUSY, pqxx::unique_violation,
  ...) onto ErrorCode so the state store handles every engine the same
  way. Nothing above internal/db sees a sqlite or pqxx type.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  // A live backend already holds the key, or the id is taken.
  AlreadyExists,
  // Compare-and-set lost: the stored version differs from the expected one.
  Conflict,
  // Lock contention; SQLITE_BUSY / SQLITE_LOCKED.
  Busy,
  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Retrying the whole transaction may succeed.
inline bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure || code == ErrorCode::Conflict;
}

/*
  Thrown by an engine when the transaction as a whole was aborted
  (serialization failure, deadlock) from a call that cannot return a
  Result. The caller rolls back and retries.
*/
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace orchestrator::db
