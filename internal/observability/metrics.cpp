#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define ORCHESTRATOR_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ORCHESTRATOR_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include <google/protobuf/util/time_util.h>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace orchestrator::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

constexpr std::chrono::milliseconds kDefaultExportInterval{1000};

opentelemetry::nostd::string_view View(std::string_view value) {
  return {value.data(), value.size()};
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const otlp_settings::Settings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.tls;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

void StartPipeline(const otlp_settings::Settings& settings, std::chrono::milliseconds export_interval) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = export_interval;
  // Export must finish before the next tick.
  reader_options.export_timeout_millis = export_interval / 2;
#ifdef ORCHESTRATOR_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(settings), reader_options);
#endif

  auto resource = otlp_settings::BuildResource();
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      route_wait_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> placement_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lease_expiry_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> worker_lost_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> drain_timeout_count;
};

bool InitializeMetrics(const orchestrator::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto interval = kDefaultExportInterval;
  if (observability.has_metrics_export_interval()) {
    interval = std::max(std::chrono::milliseconds(1), std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(
                                                          observability.metrics_export_interval())));
  }
  StartPipeline(otlp_settings::Resolve(config, otlp_settings::Signal::kMetrics), interval);
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->request_count      = impl_->meter->CreateUInt64Counter("orchestrator.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("orchestrator.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->transition_count   = impl_->meter->CreateUInt64Counter("orchestrator.backend.transitions", "1", "Applied backend state transitions");
  impl_->route_wait_ms      = impl_->meter->CreateDoubleHistogram("orchestrator.route.wait_ms", "ms", "Time connections spent waiting for a backend");
  impl_->placement_count    = impl_->meter->CreateUInt64Counter("orchestrator.placement.count", "1", "Placement attempts by outcome");
  impl_->lease_expiry_count = impl_->meter->CreateUInt64Counter("orchestrator.lease.expired", "1", "Leases reclaimed by the sweeper");
  impl_->worker_lost_count  = impl_->meter->CreateUInt64Counter("orchestrator.worker.lost", "1", "Workers declared lost after missed heartbeats");
  impl_->drain_timeout_count =
      impl_->meter->CreateUInt64Counter("orchestrator.drain.timeouts", "1", "Draining backends terminated when the grace period ran out");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordTransition(std::string_view to_state) {
  if (!impl_ || !impl_->transition_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"to", View(to_state)}};
  AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRouteWaitMs(std::string_view outcome, double wait_ms) {
  if (!impl_ || !impl_->route_wait_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", View(outcome)}};
  RecordWithAttributes(impl_->route_wait_ms, wait_ms, attributes);
}

void Metrics::RecordPlacement(bool accepted) {
  if (!impl_ || !impl_->placement_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"accepted", accepted}};
  AddWithAttributes(impl_->placement_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordLeaseExpiry(std::string_view resulting_state) {
  if (!impl_ || !impl_->lease_expiry_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"state", View(resulting_state)}};
  AddWithAttributes(impl_->lease_expiry_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordWorkerLost() {
  if (impl_ && impl_->worker_lost_count) {
    impl_->worker_lost_count->Add(1);
  }
}

void Metrics::RecordDrainTimeout() {
  if (impl_ && impl_->drain_timeout_count) {
    impl_->drain_timeout_count->Add(1);
  }
}

} // namespace orchestrator::observability

#endif
