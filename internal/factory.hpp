#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace registrar::factory {

/*
  Application

  Owns everything the server needs for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  service::ServiceContext context;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  The only place that knows concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const registrar::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.
  This is the composition root of the application.
*/
Application Build(const registrar::runtime::config::RuntimeConfig& config);

} // namespace registrar::factory
