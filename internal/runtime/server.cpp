#include "server.hpp"

#include <stdexcept>

#include <grpcpp/health_check_service_interface.h>

#include "internal/observability/logging.hpp"

namespace registrar::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
               std::chrono::milliseconds shutdown_grace)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), shutdown_grace_(shutdown_grace) {}

Server::~Server() {
  Stop();
}

void Server::SetServing(bool serving) {
  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(serving);
  }
}

void Server::Start() {
  if (grpc_server_) {
    throw std::logic_error("registrar server already started on " + bind_address_);
  }

  ::grpc::EnableDefaultHealthCheckService(true);

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("cannot listen on " + bind_address_);
  }
  SetServing(true);

  REGISTRAR_LOG_INFO("Registrar listening", {registrar::observability::StringField("bind_address", bind_address_),
                                             registrar::observability::IntField("port", selected_port_),
                                             registrar::observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }

  SetServing(false);
  grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
  grpc_server_.reset();
  REGISTRAR_LOG_INFO("Registrar stopped", {registrar::observability::IntField("grace_ms", shutdown_grace_.count())});
}

} // namespace registrar::runtime
