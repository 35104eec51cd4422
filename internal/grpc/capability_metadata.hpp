#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/core/capability.hpp"

namespace registrar::grpc {

// Metadata key the authorization layer uses for the resolved capabilities.
inline constexpr const char* kCapabilitiesMetadataKey = "x-registrar-capabilities";

// Empty set when the context is null or carries no capability header.
registrar::core::CapabilitySet CapabilitiesFrom(const ::grpc::ServerContext* context);

} // namespace registrar::grpc
