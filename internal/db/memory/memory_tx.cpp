#include "memory_tx.hpp"

#include <stdexcept>

namespace orchestrator::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!lock_.owns_lock()) {
    throw std::logic_error("memory transaction: write after commit or rollback");
  }
  if (!dirty_) {
    working_ = repo_.committed_;
    dirty_   = true;
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw std::logic_error("memory transaction: commit after rollback");
  }
  if (dirty_) {
    repo_.committed_ = std::move(working_);
    dirty_           = false;
  }
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  dirty_ = false;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace orchestrator::db::memory
