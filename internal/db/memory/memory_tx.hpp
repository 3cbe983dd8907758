#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace orchestrator::db::memory {

/*
  Exclusive lock over the repository plus a copy-on-write working set.

  Reads go straight to the committed state until the first write copies
  it; read-only operations (Get, History, ListLive) never copy.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return dirty_ ? working_ : repo_.committed_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         dirty_     = false;
  bool                         committed_ = false;
};

} // namespace orchestrator::db::memory
