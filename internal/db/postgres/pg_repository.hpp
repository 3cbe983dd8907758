#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace orchestrator::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBackend(Transaction&, const model::BackendRecord&) override;
  std::optional<model::BackendRecord> GetBackend(Transaction&, const std::string&) override;
  std::optional<model::BackendRecord> GetLiveBackendByKey(Transaction&, const std::string&) override;
  std::vector<model::BackendRecord> ListBackends(Transaction&) override;
  std::vector<model::BackendRecord> ListLiveBackends(Transaction&) override;
  std::vector<model::BackendRecord> ListBackendsByWorker(Transaction&, const std::string&) override;
  Result UpdateBackendIfVersion(Transaction&, const model::BackendRecord&, uint64_t expected_version) override;
  Result PurgeTerminalBackends(Transaction&, uint64_t cutoff_ms, uint64_t& purged) override;

  Result UpsertWorker(Transaction&, const model::WorkerRecord&) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string&) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&) override;

  Result UpsertLease(Transaction&, const model::LeaseRecord&) override;
  std::optional<model::LeaseRecord> GetLease(Transaction&, const std::string&) override;
  Result RenewLeases(Transaction&, const std::string& worker_id, uint64_t epoch, uint64_t expires_at_ms,
                     uint64_t& renewed) override;
  std::vector<model::LeaseRecord> ListExpiredLeases(Transaction&, uint64_t now_ms) override;

  Result AppendTransition(Transaction&, model::TransitionRecord&) override;
  std::vector<model::TransitionRecord> GetTransitions(Transaction&, const std::string&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
