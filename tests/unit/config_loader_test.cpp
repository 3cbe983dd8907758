#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <google/protobuf/util/time_util.h>

namespace {

using google::protobuf::util::TimeUtil;
using orchestrator::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "orchestrator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
  shutdown_grace: "10s"
proxy:
  bind_address: "0.0.0.0:7000"
  connect_timeout: "2s"
database:
  sqlite:
    path: "/var/lib/orchestrator/state.db"
    wal_mode: true
leases:
  heartbeat_interval: "5s"
  lease_duration: "15s"
  sweep_interval: "1s"
scheduler:
  placement_policy: round_robin
  max_placement_attempts: 4
  placement_timeout: "3s"
  store_retry:
    max_attempts: 6
    initial_backoff: "0.002s"
    max_backoff: "0.1s"
router:
  wait_timeout: "30s"
  poll_interval: "0.25s"
  cache_ttl: "1s"
  drain_grace: "30s"
retention:
  terminal_retention: "3600s"
logging:
  level: debug
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  ConfigLoader::Validate(config);

  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(TimeUtil::DurationToSeconds(config.server().shutdown_grace()) == 10);
  assert(config.proxy().bind_address() == "0.0.0.0:7000");
  assert(TimeUtil::DurationToMilliseconds(config.proxy().connect_timeout()) == 2000);
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/orchestrator/state.db");
  assert(config.database().sqlite().wal_mode());
  assert(TimeUtil::DurationToMilliseconds(config.leases().lease_duration()) == 15000);
  assert(config.scheduler().placement_policy() == "round_robin");
  assert(config.scheduler().max_placement_attempts() == 4);
  assert(config.scheduler().store_retry().max_attempts() == 6);
  assert(TimeUtil::DurationToMilliseconds(config.scheduler().store_retry().initial_backoff()) == 2);
  assert(TimeUtil::DurationToMilliseconds(config.router().poll_interval()) == 250);
  assert(TimeUtil::DurationToSeconds(config.retention().terminal_retention()) == 3600);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == orchestrator::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestMinimalMemoryConfig() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  ConfigLoader::Validate(config);
  assert(config.database().has_memory());
  assert(!config.has_leases());
  assert(config.scheduler().placement_policy().empty());
}

void TestUnknownFieldsAreRejected() {
  assert(Throws<std::runtime_error>([] {
    ConfigLoader::LoadFromYamlString(R"(scheduler:
  placement_policy: least_loaded
  warp_factor: 9
)");
  }));
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYamlString("router: [1, 2"); }));
  assert(Throws<std::runtime_error>([] { ConfigLoader::LoadFromYaml("/nonexistent/orchestrator.yaml"); }));
}

void TestValidationErrors() {
  auto bad_policy = ConfigLoader::LoadFromYamlString(R"(scheduler:
  placement_policy: random
)");
  assert(Throws<std::invalid_argument>([&] { ConfigLoader::Validate(bad_policy); }));

  auto short_lease = ConfigLoader::LoadFromYamlString(R"(leases:
  heartbeat_interval: "5s"
  lease_duration: "5s"
)");
  assert(Throws<std::invalid_argument>([&] { ConfigLoader::Validate(short_lease); }));

  auto negative = ConfigLoader::LoadFromYamlString(R"(router:
  drain_grace: "-1s"
)");
  assert(Throws<std::invalid_argument>([&] { ConfigLoader::Validate(negative); }));

  auto no_path = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    wal_mode: true
)");
  assert(Throws<std::invalid_argument>([&] { ConfigLoader::Validate(no_path); }));

  auto no_uri = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    max_connections: 4
)");
  assert(Throws<std::invalid_argument>([&] { ConfigLoader::Validate(no_uri); }));

  // An unset lease duration falls back to 3 x heartbeat and is accepted.
  auto derived = ConfigLoader::LoadFromYamlString(R"(leases:
  heartbeat_interval: "5s"
)");
  ConfigLoader::Validate(derived);
}

void TestScalarEscaping() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\orchestrator\\\"quoted\"\\state.db"
)");
  assert(config.database().sqlite().path() == "C:\\orchestrator\\\"quoted\"\\state.db");
}

void TestEnvironmentExpansion() {
  ::setenv("ORCHESTRATOR_TEST_PGUSER", "sessions", 1);
  ::unsetenv("ORCHESTRATOR_TEST_PGDB");
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://${ORCHESTRATOR_TEST_PGUSER}@db/${ORCHESTRATOR_TEST_PGDB:-orchestrator}"
)");
  assert(config.database().postgres().connection_uri() == "postgresql://sessions@db/orchestrator");

  ::unsetenv("ORCHESTRATOR_TEST_UNSET");
  assert(Throws<std::runtime_error>([] {
    ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "${ORCHESTRATOR_TEST_UNSET}"
)");
  }));
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(proxy:
  bind_address: "7000"
logging:
  level: "true"
)");
  assert(config.proxy().bind_address() == "7000");
  assert(config.logging().level() == "true");
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestMinimalMemoryConfig();
  TestUnknownFieldsAreRejected();
  TestValidationErrors();
  TestScalarEscaping();
  TestEnvironmentExpansion();
  TestQuotedScalarsStayStrings();

  std::cout << "orchestrator_unit_config_loader: pass\n";
  return 0;
}
