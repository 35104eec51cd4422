#include "transaction_runner.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace registrar::core {

void ThrowIfDbError(const db::Result& result, const std::string& context, const std::string& key) {
  if (result) {
    return;
  }

  std::string message = context + ": ";
  message += result.message.empty() ? std::string(db::ErrorCodeName(result.code)) : result.message;

  if (result.IsDuplicate()) {
    throw util::AlreadyExists(message, key);
  }
  if (result.IsRetryable()) {
    throw db::TransactionConflict(message);
  }
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound(message, key);
  }
  throw std::runtime_error(message);
}

} // namespace registrar::core
