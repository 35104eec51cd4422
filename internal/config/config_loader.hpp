#pragma once

#include <string>

#include "config/config.pb.h"

namespace registrar::config {

inline constexpr const char* kDefaultBindAddress         = "0.0.0.0:50061";
inline constexpr uint32_t    kDefaultMaxAllocationRetries = 5;
inline constexpr uint32_t    kDefaultShutdownGraceMs      = 5000;

/*
  Loads the registrar RuntimeConfig from YAML.

  The document goes through protobuf's JSON parser, so field names follow
  config.proto and unknown fields are rejected. Unset fields fall back to
  the defaults above and a config with no database section runs on the
  in-memory store. Every failure is a std::runtime_error naming the file.
*/
class ConfigLoader {
 public:
  static registrar::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static registrar::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(registrar::runtime::config::RuntimeConfig& config);
  static void Validate(const registrar::runtime::config::RuntimeConfig& config, const std::string& origin);
};

} // namespace registrar::config
