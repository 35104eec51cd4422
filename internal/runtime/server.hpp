#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace registrar::runtime {

/*
  gRPC front end for the registrar services.

  Also exposes the standard grpc.health.v1 service; it reports SERVING
  between Start() and Stop(). Stop() lets in-flight calls run for the
  shutdown grace period and cancels whatever is still running after it.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::chrono::milliseconds shutdown_grace = std::chrono::seconds(5));
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  bool running() const { return grpc_server_ != nullptr; }

  // Port actually bound; differs from the configured one when it asked for port 0.
  int selected_port() const { return selected_port_; }

private:
  void SetServing(bool serving);

  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::chrono::milliseconds shutdown_grace_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace registrar::runtime
