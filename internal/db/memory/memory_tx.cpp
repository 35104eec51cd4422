#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace registrar::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), repo_lock_(repo.tx_mutex_) {
  snapshot_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  if (repo_lock_.owns_lock()) Rollback();
}

void MemoryTransaction::RequireOpen(const char* action) const {
  if (!repo_lock_.owns_lock()) {
    throw std::logic_error(std::string(action) + " on a finished memory transaction");
  }
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  RequireOpen("write");
  if (!working_) {
    working_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  RequireOpen("commit");
  if (working_) {
    repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(working_));
  }
  committed_ = true;
  repo_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  RequireOpen("rollback");
  working_.reset();
  repo_lock_.unlock();
}

} // namespace registrar::db::memory
