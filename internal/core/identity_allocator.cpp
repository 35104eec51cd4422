#include "identity_allocator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "internal/core/transaction_runner.hpp"
#include "internal/util/errors.hpp"

namespace registrar::core {

namespace {

constexpr int kMinYear = 1000;
constexpr int kMaxYear = 9999;

} // namespace

IdentityAllocator::IdentityAllocator(std::shared_ptr<db::Repository> repository, uint32_t max_allocation_retries)
    : repository_(std::move(repository)), max_allocation_retries_(max_allocation_retries) {
}

void IdentityAllocator::ValidateYear(int year) {
  if (year < kMinYear || year > kMaxYear) {
    throw util::ValidationError("student id year must be between 1000 and 9999, got " + std::to_string(year), std::to_string(year));
  }
}

std::string IdentityAllocator::Prefix(int year) {
  return "STU" + std::to_string(year);
}

std::string IdentityAllocator::FormatStudentId(int year, uint64_t sequence) {
  std::ostringstream out;
  out << Prefix(year) << std::setw(4) << std::setfill('0') << sequence;
  return out.str();
}

std::optional<uint64_t> IdentityAllocator::ParseSequence(const std::string& id, int year) {
  const auto prefix = Prefix(year);
  if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }

  uint64_t sequence = 0;
  for (std::size_t i = prefix.size(); i < id.size(); ++i) {
    const char c = id[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    sequence = sequence * 10 + static_cast<uint64_t>(c - '0');
  }
  return sequence;
}

std::unique_lock<std::mutex> IdentityAllocator::LockYear(int year) {
  return year_locks_.Lock(std::to_string(year));
}

std::string IdentityAllocator::AllocateWithin(db::Transaction& tx, int year) {
  ValidateYear(year);

  uint64_t highest = repository_->GetStudentSequence(tx, year).value_or(0);
  for (const auto& id : repository_->ListStudentIdsWithPrefix(tx, Prefix(year))) {
    if (const auto sequence = ParseSequence(id, year)) {
      highest = std::max(highest, *sequence);
    }
  }

  const uint64_t next = highest + 1;
  ThrowIfDbError(repository_->SetStudentSequence(tx, year, next), "advance student id sequence", std::to_string(year));
  return FormatStudentId(year, next);
}

std::string IdentityAllocator::Allocate(int year) {
  ValidateYear(year);

  auto lock = LockYear(year);
  try {
    return RunInTransaction(*repository_, max_attempts(), [&](db::Transaction& tx) { return AllocateWithin(tx, year); });
  } catch (const db::TransactionConflict& e) {
    throw util::AllocationConflict("student id allocation for " + std::to_string(year) + " kept conflicting: " + e.what(),
                                   std::to_string(year));
  }
}

} // namespace registrar::core
