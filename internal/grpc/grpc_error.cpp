#include "grpc_error.hpp"

#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace registrar::grpc {

namespace {

template <typename... Errors>
bool IsAnyOf(const std::exception& e) {
  return (... || (dynamic_cast<const Errors*>(&e) != nullptr));
}

} // namespace

::grpc::StatusCode StatusCodeFor(const std::exception& e) {
  using namespace registrar::util;

  if (IsAnyOf<NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  // covers DuplicateEnrollment
  if (IsAnyOf<AlreadyExists>(e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  if (IsAnyOf<InvalidScore, ValidationError>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (IsAnyOf<AllocationConflict, registrar::db::TransactionConflict>(e)) return ::grpc::StatusCode::ABORTED;
  if (IsAnyOf<PermissionDenied>(e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  const auto code = StatusCodeFor(e);
  if (const auto* records_error = dynamic_cast<const registrar::util::RecordsError*>(&e)) {
    return {code, e.what(), records_error->key()};
  }
  return {code, e.what()};
}

} // namespace registrar::grpc
