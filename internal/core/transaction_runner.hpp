#pragma once

#include <cstdint>
#include <string>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"

namespace registrar::core {

inline constexpr uint32_t kDefaultTransactionAttempts = 5;

// Translates a failed store result into the matching util:: error.
void ThrowIfDbError(const db::Result& result, const std::string& context, const std::string& key = {});

/*
  Runs fn(tx) in a fresh transaction and commits it.

  A commit that lost to a concurrent writer (db::TransactionConflict) reruns
  the whole unit of work, up to max_attempts in total; the last conflict is
  rethrown. Any other exception rolls the transaction back and propagates.
*/
template <typename Fn>
auto RunInTransaction(db::Repository& repository, uint32_t max_attempts, Fn&& fn) {
  if (max_attempts == 0) {
    max_attempts = 1;
  }

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<std::invoke_result_t<Fn&, db::Transaction&>>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const db::TransactionConflict&) {
      if (attempt >= max_attempts) {
        throw;
      }
    }
  }
}

} // namespace registrar::core
