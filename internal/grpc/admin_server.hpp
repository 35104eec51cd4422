#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "registrar/services/v1/registrar_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace registrar::grpc {

class AdminServer final : public registrar::services::v1::RegistrarAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<registrar::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                     const registrar::services::v1::StatsRequest*,
                     registrar::services::v1::StatsResponse*) override;

private:
  std::shared_ptr<registrar::service::AdminService> service_;
};

}
