#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

namespace registrar::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), connection_lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) {
    return;
  }
  // no throwing from here; sqlite discards the open transaction if this fails
  sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
}

void SqliteTransaction::RequireOpen(const char* action) const {
  if (state_ != State::kOpen) {
    throw std::logic_error(std::string(action) + " on a finished sqlite transaction");
  }
}

void SqliteTransaction::Commit() {
  RequireOpen("commit");
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  RequireOpen("rollback");
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace registrar::db::sqlite
