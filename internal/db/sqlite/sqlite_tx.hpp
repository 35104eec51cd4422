#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace registrar::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  Taking the write lock at BEGIN means a read-then-write such as the
  student-id sequence bump cannot interleave with another writer. The
  connection mutex is held for the whole lifetime of the object.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RequireOpen(const char* action) const;

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> connection_lock_;
  State                        state_ = State::kOpen;
};

} // namespace registrar::db::sqlite
