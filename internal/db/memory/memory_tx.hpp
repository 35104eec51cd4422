#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace registrar::db::memory {

/*
  Copy-on-write view of the repository.

  Transactions are serialized on the repository mutex from construction
  until Commit() or Rollback(), the same discipline as the SQLite
  backend's BEGIN IMMEDIATE. Reads go to the committed state; the first
  write clones it into a private working copy which Commit() publishes.
  A transaction therefore never loses to a writer on unrelated keys.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  void RequireOpen(const char* action) const;

  MemoryRepository&                              repo_;
  std::unique_lock<std::mutex>                   repo_lock_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  bool                                           committed_ = false;
};

} // namespace registrar::db::memory
