#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/capability.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/capability_metadata.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/records_server.hpp"
#include "internal/grpc/report_server.hpp"
#include "internal/service/records_service.hpp"
#include "internal/service/report_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "registrar/v1.hpp"

namespace {

using registrar::core::Capability;
using registrar::core::CapabilitySet;
using namespace registrar::v1;

registrar::service::ServiceContext BuildServiceContext() {
  return registrar::service::BuildServiceContext(std::make_shared<registrar::db::memory::MemoryRepository>(), 5);
}

void TestErrorMapping() {
  using registrar::grpc::ToStatus;

  assert(ToStatus(registrar::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(registrar::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(registrar::util::DuplicateEnrollment("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(registrar::util::InvalidScore("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(registrar::util::ValidationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(registrar::util::AllocationConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(registrar::db::TransactionConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(registrar::util::PermissionDenied("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(registrar::util::DuplicateEnrollment("already enrolled", "STU20240007"));
  assert(status.error_message() == "already enrolled");
  assert(status.error_details() == "STU20240007");
  assert(ToStatus(std::runtime_error("disk full")).error_details().empty());
}

void TestCapabilityParsing() {
  const auto caps = CapabilitySet::Parse(" enroll,record_grade , bogus");
  assert(caps.Has(Capability::kEnroll));
  assert(caps.Has(Capability::kRecordGrade));
  assert(!caps.Has(Capability::kMarkAttendance));
  assert(!caps.Has(Capability::kManageRecords));

  assert(CapabilitySet::Parse("").Empty());
  assert(CapabilitySet::All().Has(Capability::kManageRecords));

  assert(registrar::grpc::CapabilitiesFrom(nullptr).Empty());
  ::grpc::ServerContext grpc_ctx;
  assert(registrar::grpc::CapabilitiesFrom(&grpc_ctx).Empty());
}

void TestGetMissingStudentReturnsNotFound() {
  auto                         svc = std::make_shared<registrar::service::RecordsService>(BuildServiceContext());
  registrar::grpc::RecordsServer server(svc);

  GetStudentRequest req;
  req.set_student_id("STU20240001");
  GetStudentResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.GetStudent(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(status.error_details() == "STU20240001");
}

void TestPrivilegedCallWithoutCapabilitiesIsDenied() {
  auto                           svc = std::make_shared<registrar::service::RecordsService>(BuildServiceContext());
  registrar::grpc::RecordsServer server(svc);

  CreateCourseRequest req;
  req.mutable_course()->set_code("CS101");
  req.mutable_course()->set_name("Programming");
  req.mutable_course()->set_credit_hours(3);
  CreateCourseResponse  resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.CreateCourse(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  ListCoursesRequest    list_req;
  ListCoursesResponse   list_resp;
  ::grpc::ServerContext list_ctx;
  assert(server.ListCourses(&list_ctx, &list_req, &list_resp).ok());
  assert(list_resp.courses_size() == 0);
}

void TestInvalidRangeReturnsInvalidArgument() {
  auto                          ctx = BuildServiceContext();
  auto                          svc = std::make_shared<registrar::service::ReportService>(ctx);
  registrar::grpc::ReportServer server(svc);

  BuildAttendanceSummaryRequest req;
  req.set_student_id("STU20240001");
  req.set_course_code("CS101");
  req.mutable_range()->set_from("01/09/2024");
  BuildAttendanceSummaryResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.BuildAttendanceSummary(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestReportForUnknownStudentIsOk() {
  auto                          ctx = BuildServiceContext();
  auto                          svc = std::make_shared<registrar::service::ReportService>(ctx);
  registrar::grpc::ReportServer server(svc);

  BuildReportCardRequest req;
  req.set_student_id("STU20249999");
  BuildReportCardResponse resp;
  ::grpc::ServerContext   grpc_ctx;

  assert(server.BuildReportCard(&grpc_ctx, &req, &resp).ok());
  assert(resp.report_card().lines_size() == 0);
  assert(resp.report_card().gpa() == 0.0);
}

} // namespace

int main() {
  TestErrorMapping();
  TestCapabilityParsing();
  TestGetMissingStudentReturnsNotFound();
  TestPrivilegedCallWithoutCapabilitiesIsDenied();
  TestInvalidRangeReturnsInvalidArgument();
  TestReportForUnknownStudentIsOk();

  std::cout << "registrar_unit_grpc_status: pass\n";
  return 0;
}
