#include "report_service.hpp"

#include "internal/core/report_assembler.hpp"
#include "observe_rpc.hpp"
#include "registrar/v1.hpp"

namespace registrar::service {

using namespace registrar::v1;

ReportService::ReportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

BuildReportCardResponse ReportService::BuildReportCard(const BuildReportCardRequest& req) {
  return ObserveRpc("ReportService.BuildReportCard", [&] {
    BuildReportCardResponse resp;
    *resp.mutable_report_card() = ctx_.reports->BuildReportCard(req.student_id(), req.semester(), req.academic_year());
    return resp;
  });
}

BuildAttendanceSummaryResponse ReportService::BuildAttendanceSummary(const BuildAttendanceSummaryRequest& req) {
  return ObserveRpc("ReportService.BuildAttendanceSummary", [&] {
    BuildAttendanceSummaryResponse resp;
    *resp.mutable_summary() =
        ctx_.reports->BuildAttendanceSummary(req.student_id(), req.course_code(), req.range().from(), req.range().to());
    return resp;
  });
}

}
