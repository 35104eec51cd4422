#pragma once

#include "registrar/services/v1/registrar_report_service.pb.h"
#include "service_context.hpp"

namespace registrar::service {

class ReportService {
public:
  explicit ReportService(ServiceContext ctx);

  registrar::services::v1::BuildReportCardResponse
  BuildReportCard(const registrar::services::v1::BuildReportCardRequest& req);

  registrar::services::v1::BuildAttendanceSummaryResponse
  BuildAttendanceSummary(const registrar::services::v1::BuildAttendanceSummaryRequest& req);

private:
  ServiceContext ctx_;
};

}
