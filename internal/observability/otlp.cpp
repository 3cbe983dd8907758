#ifdef ENABLE_OTEL

#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace orchestrator::observability::otlp_settings {
namespace {

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

} // namespace

Settings Resolve(const orchestrator::runtime::config::RuntimeConfig& config, Signal signal) {
  const auto& observability = config.observability();

  Settings settings;
  settings.http = observability.transport() == orchestrator::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.tls  = observability.otlp_tls();

  const char* signal_env = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = EnvOrNull(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = EnvOrNull("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else if (settings.http) {
    settings.endpoint = signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }
  return settings;
}

opentelemetry::sdk::resource::Resource BuildResource() {
  const char*                                      name  = EnvOrNull("OTEL_SERVICE_NAME");
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", std::string(name != nullptr ? name : kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)}};
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace orchestrator::observability::otlp_settings

#endif
