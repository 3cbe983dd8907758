#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace orchestrator::runtime::config {
class RuntimeConfig;
}

namespace orchestrator::observability {

inline constexpr const char* kInstrumentationName    = "orchestrator";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

/*
  OTLP pipelines, switched on by the observability section of the config.
  Without ENABLE_OTEL everything here compiles to inline no-ops, so call
  sites carry no guards of their own.
*/
bool InitializeTracing(const orchestrator::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const orchestrator::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the enclosing scope; ended on destruction.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  // Marks the span as failed.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // Per RPC, labelled by "<Service>.<Method>".
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordTransition(std::string_view to_state);
  // outcome: "ready", "failed", "timeout", "cancelled"
  void ObserveRouteWaitMs(std::string_view outcome, double wait_ms);
  void RecordPlacement(bool accepted);
  void RecordLeaseExpiry(std::string_view resulting_state);
  void RecordWorkerLost();
  void RecordDrainTimeout();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const orchestrator::runtime::config::RuntimeConfig&) {
  return false;
}
inline bool InitializeMetrics(const orchestrator::runtime::config::RuntimeConfig&) {
  return false;
}
inline void ShutdownTracing() {
}
inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}
inline SpanScope::~SpanScope() {
}
inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}
inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}
inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRequest(std::string_view, bool) {
}
inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
inline void Metrics::RecordTransition(std::string_view) {
}
inline void Metrics::ObserveRouteWaitMs(std::string_view, double) {
}
inline void Metrics::RecordPlacement(bool) {
}
inline void Metrics::RecordLeaseExpiry(std::string_view) {
}
inline void Metrics::RecordWorkerLost() {
}
inline void Metrics::RecordDrainTimeout() {
}
#endif

} // namespace orchestrator::observability
