#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace registrar::grpc {

// Status code a thrown error maps to; INTERNAL for anything unrecognized.
::grpc::StatusCode StatusCodeFor(const std::exception& e);

/*
  Converts an exception raised by a service call into a gRPC status.

  The message is the exception text. For util::RecordsError the offending
  key (student id, course code, enrollment id) travels in the status
  details so clients can act on it without parsing the message.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace registrar::grpc
