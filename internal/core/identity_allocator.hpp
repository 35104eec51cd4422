#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/key_locks.hpp"

namespace registrar::core {

/*
  Hands out student identifiers "STU<year><seq>".

  The next sequence for a year is one past the larger of
    - the highest sequence among existing ids with that prefix, and
    - the persisted high-water mark for the year,
  and the high-water mark is advanced in the same transaction. An id is
  therefore never handed out twice, even when its student was deleted or
  never created.

  Allocations for one year are serialized by an in-process lock plus the
  store transaction; commit conflicts are retried and finally surface as
  util::AllocationConflict.
*/
class IdentityAllocator {
 public:
  IdentityAllocator(std::shared_ptr<db::Repository> repository, uint32_t max_allocation_retries);

  // Allocates in a transaction of its own.
  std::string Allocate(int year);

  // Allocates inside the caller's transaction. The caller must hold LockYear(year)
  // until that transaction has committed.
  std::string AllocateWithin(db::Transaction& tx, int year);

  [[nodiscard]] std::unique_lock<std::mutex> LockYear(int year);

  uint32_t max_attempts() const {
    return max_allocation_retries_ + 1;
  }

  // Throws util::ValidationError unless 1000 <= year <= 9999.
  static void ValidateYear(int year);

  static std::string             Prefix(int year);
  static std::string             FormatStudentId(int year, uint64_t sequence);
  static std::optional<uint64_t> ParseSequence(const std::string& id, int year);

 private:
  std::shared_ptr<db::Repository> repository_;
  uint32_t                        max_allocation_retries_;
  util::KeyLocks<16>              year_locks_;
};

} // namespace registrar::core
