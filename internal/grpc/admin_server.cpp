#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "registrar/v1.hpp"

namespace registrar::grpc {

AdminServer::AdminServer(std::shared_ptr<registrar::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const registrar::services::v1::StatsRequest* req,
                                  registrar::services::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace registrar::grpc
