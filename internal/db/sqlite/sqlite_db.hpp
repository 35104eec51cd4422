#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace registrar::db::sqlite {

/*
  Owns the single sqlite3 connection behind the records store.

  Every request thread shares it, so transactions are serialized through
  TransactionMutex(): a SqliteTransaction holds it from BEGIN to
  COMMIT/ROLLBACK.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // SQLITE_BUSY / SQLITE_LOCKED surface as db::TransactionConflict,
  // anything else as std::runtime_error naming the database file.
  void Exec(const std::string& sql);

  // Caller owns the statement and must sqlite3_finalize it.
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void ApplyPragmas(bool wal_mode);
  [[noreturn]] void Fail(const std::string& what, const std::string& detail) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace registrar::db::sqlite
