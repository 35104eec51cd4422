#include "capability_metadata.hpp"

#include <string_view>

namespace registrar::grpc {

registrar::core::CapabilitySet CapabilitiesFrom(const ::grpc::ServerContext* context) {
  registrar::core::CapabilitySet caps;
  if (!context) {
    return caps;
  }

  const auto& metadata = context->client_metadata();
  const auto  range    = metadata.equal_range(kCapabilitiesMetadataKey);
  for (auto it = range.first; it != range.second; ++it) {
    caps.Merge(registrar::core::CapabilitySet::Parse(std::string_view(it->second.data(), it->second.size())));
  }
  return caps;
}

} // namespace registrar::grpc
