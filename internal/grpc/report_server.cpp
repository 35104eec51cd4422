#include "report_server.hpp"

#include "grpc_error.hpp"
#include "registrar/v1.hpp"

namespace registrar::grpc {

ReportServer::ReportServer(std::shared_ptr<registrar::service::ReportService> svc) : service_(std::move(svc)) {
}

::grpc::Status ReportServer::BuildReportCard(::grpc::ServerContext*, const registrar::services::v1::BuildReportCardRequest* req,
                                             registrar::services::v1::BuildReportCardResponse* resp) {
  try {
    *resp = service_->BuildReportCard(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReportServer::BuildAttendanceSummary(::grpc::ServerContext*, const registrar::services::v1::BuildAttendanceSummaryRequest* req,
                                                    registrar::services::v1::BuildAttendanceSummaryResponse* resp) {
  try {
    *resp = service_->BuildAttendanceSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace registrar::grpc
