#include <google/protobuf/util/time_util.h>

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include "client/cpp/orchestrator_client.h"
#include "orchestrator/v1/types.pb.h"

using namespace orchestrator::v1;
using orchestrator::client::OrchestratorClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  orchestratorctl <addr> acquire <key>\n"
            << "  orchestratorctl <addr> get <backend_id>\n"
            << "  orchestratorctl <addr> list [--live]\n"
            << "  orchestratorctl <addr> history <backend_id>\n"
            << "  orchestratorctl <addr> terminate <backend_id>\n"
            << "  orchestratorctl <addr> workers\n"
            << "  orchestratorctl <addr> drain-worker <worker_id>\n";
}

static std::string StateName(BackendState state) {
  // BACKEND_STATE_READY -> ready
  std::string name = BackendState_Name(state);
  const std::string prefix = "BACKEND_STATE_";
  if (name.rfind(prefix, 0) == 0) name = name.substr(prefix.size());
  for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return name;
}

static void PrintBackend(const Backend& backend) {
  std::cout << backend.id() << " key=" << backend.key() << " state=" << StateName(backend.state())
            << " worker=" << backend.worker_id() << " version=" << backend.version();
  if (!backend.address().empty()) {
    std::cout << " address=" << backend.address();
  }
  if (!backend.cause().empty()) {
    std::cout << " cause=\"" << backend.cause() << "\"";
  }
  std::cout << "\n";
}

static void PrintWorker(const Worker& worker) {
  std::cout << worker.id() << " status=" << WorkerStatus_Name(worker.status()) << " address=" << worker.address()
            << " epoch=" << worker.epoch() << " live=" << worker.live_backends();
  if (worker.capacity_hint() > 0) {
    std::cout << " capacity=" << worker.capacity_hint();
  }
  std::cout << " last_heartbeat=" << google::protobuf::util::TimeUtil::ToString(worker.last_heartbeat_at()) << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  auto client = OrchestratorClient::Connect(addr, std::chrono::milliseconds(30000));

  // ------------------------------------------------------------

  if (cmd == "acquire") {
    if (argc < 4) return 1;

    AcquireResponse resp;
    auto status = client.Acquire(argv[3], &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.created() ? "created " : "existing ");
    PrintBackend(resp.backend());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    Backend backend;
    auto status = client.GetBackend(argv[3], &backend);
    if (!status.ok()) return Fail(status);

    PrintBackend(backend);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    const bool live_only = argc >= 4 && std::string(argv[3]) == "--live";

    ListBackendsResponse resp;
    auto status = client.ListBackends(live_only, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& backend : resp.backends()) {
      PrintBackend(backend);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 4) return 1;

    BackendHistoryResponse resp;
    auto status = client.BackendHistory(argv[3], &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.sequence() << " v" << entry.version() << " " << StateName(entry.from_state()) << " -> "
                << StateName(entry.to_state()) << " at=" << google::protobuf::util::TimeUtil::ToString(entry.at())
                << " cause=\"" << entry.cause() << "\"\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "terminate") {
    if (argc < 4) return 1;

    Backend backend;
    auto status = client.TerminateBackend(argv[3], &backend);
    if (!status.ok()) return Fail(status);

    PrintBackend(backend);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "workers") {
    ListWorkersResponse resp;
    auto status = client.ListWorkers(&resp);
    if (!status.ok()) return Fail(status);

    for (const auto& worker : resp.workers()) {
      PrintWorker(worker);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "drain-worker") {
    if (argc < 4) return 1;

    Worker worker;
    auto status = client.DrainWorker(argv[3], &worker);
    if (!status.ok()) return Fail(status);

    PrintWorker(worker);
    return 0;
  }

  Usage();
  return 1;
}
