#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace registrar::config {

namespace {

using registrar::runtime::config::RuntimeConfig;

[[noreturn]] void Reject(const std::string& origin, const std::string& reason) {
  throw std::runtime_error("Invalid configuration " + origin + ": " + reason);
}

// Plain scalars become bool or number when they read as one. Quoted
// scalars ("5", "true") carry the non-specific tag and stay strings.
void ScalarToValue(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }
  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      out->set_number_value(number);
      return;
    }
  }
  out->set_string_value(text);
}

void NodeToValue(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ScalarToValue(node, out);
      return;
    case YAML::NodeType::Sequence:
      for (const auto& item : node) {
        NodeToValue(item, out->mutable_list_value()->add_values());
      }
      return;
    case YAML::NodeType::Map:
      for (const auto& entry : node) {
        NodeToValue(entry.second, &(*out->mutable_struct_value()->mutable_fields())[entry.first.Scalar()]);
      }
      return;
    default:
      throw std::runtime_error("unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
}

RuntimeConfig ParseDocument(const YAML::Node& document, const std::string& origin) {
  google::protobuf::Value root;
  if (document.IsNull()) {
    root.mutable_struct_value();
  } else {
    NodeToValue(document, &root);
  }

  std::string json;
  if (const auto status = google::protobuf::util::MessageToJsonString(root, &json); !status.ok()) {
    Reject(origin, std::string(status.message()));
  }

  RuntimeConfig                            config;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (const auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    Reject(origin, std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config, origin);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return ParseDocument(document, path);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return ParseDocument(document, "<inline>");
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);
  if (server->shutdown_grace_ms() == 0) server->set_shutdown_grace_ms(kDefaultShutdownGraceMs);

  if (config.database().backend_case() == registrar::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.identity().max_allocation_retries() == 0) {
    config.mutable_identity()->set_max_allocation_retries(kDefaultMaxAllocationRetries);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config, const std::string& origin) {
  const auto& bind_address = config.server().bind_address();
  const auto  colon        = bind_address.rfind(':');
  if (colon == std::string::npos || colon + 1 == bind_address.size()) {
    Reject(origin, "server.bind_address must be host:port, got '" + bind_address + "'");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    Reject(origin, "database.sqlite.path is required");
  }
}

} // namespace registrar::config
