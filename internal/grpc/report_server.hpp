#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "registrar/services/v1/registrar_report_service.grpc.pb.h"
#include "internal/service/report_service.hpp"

namespace registrar::grpc {

class ReportServer final : public registrar::services::v1::RegistrarReportService::Service {
public:
  explicit ReportServer(std::shared_ptr<registrar::service::ReportService> svc);

  ::grpc::Status BuildReportCard(::grpc::ServerContext*,
                                 const registrar::services::v1::BuildReportCardRequest*,
                                 registrar::services::v1::BuildReportCardResponse*) override;

  ::grpc::Status BuildAttendanceSummary(::grpc::ServerContext*,
                                        const registrar::services::v1::BuildAttendanceSummaryRequest*,
                                        registrar::services::v1::BuildAttendanceSummaryResponse*) override;

private:
  std::shared_ptr<registrar::service::ReportService> service_;
};

}
