#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/backend_state.hpp"

namespace orchestrator::runtime::config {
class RuntimeConfig;
}

namespace orchestrator::observability {

/*
  Structured key=value logging on top of spdlog.

  Every line is "<message> k1=v1 k2=v2 [trace_id=.. span_id=..]". Values
  with spaces, quotes or '=' are double-quoted so causes such as
  "drain grace elapsed" stay one field.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);
LogField StateField(std::string_view key, model::BackendState state);

// Level and pattern come from ORCHESTRATOR_LOG_LEVEL / ORCHESTRATOR_LOG_PATTERN
// first, then the logging section of the config. Safe to call again.
void InitializeLogging(const orchestrator::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace orchestrator::observability

#define ORCHESTRATOR_LOG_DEBUG(message, ...) ::orchestrator::observability::LogDebug((message), ##__VA_ARGS__)
#define ORCHESTRATOR_LOG_INFO(message, ...) ::orchestrator::observability::LogInfo((message), ##__VA_ARGS__)
#define ORCHESTRATOR_LOG_WARN(message, ...) ::orchestrator::observability::LogWarn((message), ##__VA_ARGS__)
#define ORCHESTRATOR_LOG_ERROR(message, ...) ::orchestrator::observability::LogError((message), ##__VA_ARGS__)
