#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "registrar/services/v1/registrar_records_service.grpc.pb.h"
#include "internal/service/records_service.hpp"

namespace registrar::grpc {

/*
  Privileged calls read the caller's capabilities from the
  x-registrar-capabilities metadata.
*/
class RecordsServer final : public registrar::services::v1::RegistrarRecordsService::Service {
public:
  explicit RecordsServer(std::shared_ptr<registrar::service::RecordsService> svc);

  ::grpc::Status CreateStudent(::grpc::ServerContext*,
                     const registrar::services::v1::CreateStudentRequest*,
                     registrar::services::v1::CreateStudentResponse*) override;

  ::grpc::Status GetStudent(::grpc::ServerContext*,
                     const registrar::services::v1::GetStudentRequest*,
                     registrar::services::v1::GetStudentResponse*) override;

  ::grpc::Status ListStudents(::grpc::ServerContext*,
                     const registrar::services::v1::ListStudentsRequest*,
                     registrar::services::v1::ListStudentsResponse*) override;

  ::grpc::Status DeleteStudent(::grpc::ServerContext*,
                     const registrar::services::v1::DeleteStudentRequest*,
                     google::protobuf::Empty*) override;

  ::grpc::Status CreateCourse(::grpc::ServerContext*,
                     const registrar::services::v1::CreateCourseRequest*,
                     registrar::services::v1::CreateCourseResponse*) override;

  ::grpc::Status GetCourse(::grpc::ServerContext*,
                     const registrar::services::v1::GetCourseRequest*,
                     registrar::services::v1::GetCourseResponse*) override;

  ::grpc::Status ListCourses(::grpc::ServerContext*,
                     const registrar::services::v1::ListCoursesRequest*,
                     registrar::services::v1::ListCoursesResponse*) override;

  ::grpc::Status DeleteCourse(::grpc::ServerContext*,
                     const registrar::services::v1::DeleteCourseRequest*,
                     google::protobuf::Empty*) override;

  ::grpc::Status Enroll(::grpc::ServerContext*,
                     const registrar::services::v1::EnrollRequest*,
                     registrar::services::v1::EnrollResponse*) override;

  ::grpc::Status ListEnrollments(::grpc::ServerContext*,
                     const registrar::services::v1::ListEnrollmentsRequest*,
                     registrar::services::v1::ListEnrollmentsResponse*) override;

  ::grpc::Status DeleteEnrollment(::grpc::ServerContext*,
                     const registrar::services::v1::DeleteEnrollmentRequest*,
                     google::protobuf::Empty*) override;

  ::grpc::Status MarkAttendance(::grpc::ServerContext*,
                     const registrar::services::v1::MarkAttendanceRequest*,
                     registrar::services::v1::MarkAttendanceResponse*) override;

  ::grpc::Status GetAttendance(::grpc::ServerContext*,
                     const registrar::services::v1::GetAttendanceRequest*,
                     registrar::services::v1::GetAttendanceResponse*) override;

  ::grpc::Status RecordGrade(::grpc::ServerContext*,
                     const registrar::services::v1::RecordGradeRequest*,
                     registrar::services::v1::RecordGradeResponse*) override;

  ::grpc::Status GetGrade(::grpc::ServerContext*,
                     const registrar::services::v1::GetGradeRequest*,
                     registrar::services::v1::GetGradeResponse*) override;

private:
  std::shared_ptr<registrar::service::RecordsService> service_;
};

}
