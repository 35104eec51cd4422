#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/grpc/capability_metadata.hpp"
#include "internal/runtime/server.hpp"
#include "registrar/v1.hpp"

namespace {

using namespace registrar::v1;

std::unique_ptr<::grpc::ClientContext> CallContext(const char* capabilities) {
  auto ctx = std::make_unique<::grpc::ClientContext>();
  ctx->set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
  if (capabilities != nullptr) {
    ctx->AddMetadata(registrar::grpc::kCapabilitiesMetadataKey, capabilities);
  }
  return ctx;
}

void TestRoundTripOverLoopback() {
  registrar::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_bind_address("127.0.0.1:0");
  config.mutable_database()->mutable_memory();
  config.mutable_identity()->set_max_allocation_retries(5);

  auto                      app = registrar::factory::Build(config);
  registrar::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services), std::chrono::milliseconds(200));
  server.Start();
  assert(server.running());
  assert(server.selected_port() > 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.selected_port()), ::grpc::InsecureChannelCredentials());
  auto records = RegistrarRecordsService::NewStub(channel);
  auto admin   = RegistrarAdminService::NewStub(channel);

  CreateCourseRequest course;
  course.mutable_course()->set_code("CS101");
  course.mutable_course()->set_name("Programming");
  course.mutable_course()->set_credit_hours(3);
  CreateCourseResponse course_resp;

  auto denied = records->CreateCourse(CallContext(nullptr).get(), course, &course_resp);
  assert(denied.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  auto created = records->CreateCourse(CallContext("manage_records").get(), course, &course_resp);
  assert(created.ok());
  assert(course_resp.course().code() == "CS101");

  auto duplicate = records->CreateCourse(CallContext("manage_records").get(), course, &course_resp);
  assert(duplicate.error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(duplicate.error_details() == "CS101");

  CreateStudentRequest student;
  student.mutable_profile()->set_name("Katherine Johnson");
  student.mutable_profile()->set_gender(GENDER_FEMALE);
  student.set_year(2024);
  CreateStudentResponse student_resp;
  assert(records->CreateStudent(CallContext("manage_records").get(), student, &student_resp).ok());
  assert(student_resp.student().id() == "STU20240001");

  // enroll alone does not carry manage_records
  CreateStudentResponse ignored;
  auto                  wrong_capability = records->CreateStudent(CallContext("enroll").get(), student, &ignored);
  assert(wrong_capability.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);

  EnrollRequest enroll;
  enroll.set_student_id(student_resp.student().id());
  enroll.set_course_code("CS101");
  enroll.set_semester("Fall");
  enroll.set_academic_year("2024-2025");
  EnrollResponse enroll_resp;
  assert(records->Enroll(CallContext("enroll").get(), enroll, &enroll_resp).ok());

  StatsResponse stats;
  assert(admin->Stats(CallContext(nullptr).get(), StatsRequest{}, &stats).ok());
  assert(stats.students() == 1);
  assert(stats.courses() == 1);
  assert(stats.enrollments() == 1);
  assert(stats.storage_backend() == "memory");

  server.Stop();
  assert(!server.running());
}

} // namespace

int main() {
  TestRoundTripOverLoopback();

  std::cout << "registrar_integration_server_roundtrip: pass\n";
  return 0;
}
