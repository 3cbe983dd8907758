#pragma once

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace orchestrator::runtime::config {
class RuntimeConfig;
}

namespace orchestrator::observability::otlp_settings {

enum class Signal {
  kTraces,
  kMetrics,
};

// Exporter settings shared by the trace and metric pipelines.
struct Settings {
  std::string endpoint;
  bool        http = false;
  bool        tls  = false;
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
Settings Resolve(const orchestrator::runtime::config::RuntimeConfig& config, Signal signal);

// service.name honours OTEL_SERVICE_NAME.
opentelemetry::sdk::resource::Resource BuildResource();

} // namespace orchestrator::observability::otlp_settings
