#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

using orchestrator::observability::BoolField;
using orchestrator::observability::StringField;
using orchestrator::runtime::Server;
using orchestrator::runtime::ServerOptions;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void Usage() {
  std::cerr << "Usage: orchestrator [--check] <config.yaml>\n"
            << "       orchestrator [--check] --config <config.yaml>\n"
            << "  --check  validate the configuration and exit\n";
}

ServerOptions ServerOptionsFrom(const orchestrator::runtime::config::RuntimeConfig& config) {
  ServerOptions options;
  if (!config.server().bind_address().empty()) options.bind_address = config.server().bind_address();
  options.shutdown_grace = orchestrator::util::DurationOr(config.server().shutdown_grace(), options.shutdown_grace);
  return options;
}

void ShutdownObservability() {
  orchestrator::observability::ShutdownMetrics();
  orchestrator::observability::ShutdownTracing();
  orchestrator::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  bool        check_only = false;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    auto config = orchestrator::config::ConfigLoader::LoadFromYaml(config_path);
    orchestrator::config::ConfigLoader::Validate(config);
    if (check_only) {
      std::cout << config_path << ": ok\n";
      return 0;
    }

    orchestrator::observability::InitializeLogging(config);
    const bool tracing = orchestrator::observability::InitializeTracing(config);
    const bool metrics = orchestrator::observability::InitializeMetrics(config);

    auto       app            = orchestrator::factory::Build(config);
    const auto server_options = ServerOptionsFrom(config);
    Server     server(server_options, std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // Recovery runs inside Start, before the RPC port accepts worker reports.
    app.Start();
    server.Start();
    ORCHESTRATOR_LOG_INFO("orchestrator started", {StringField("bind_address", server_options.bind_address),
                                                   StringField("proxy_address", config.proxy().bind_address()),
                                                   BoolField("tracing", tracing), BoolField("metrics", metrics)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    ORCHESTRATOR_LOG_INFO("orchestrator stopping");
    server.Stop();
    app.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_ERROR("fatal error", {StringField("config", config_path), StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
