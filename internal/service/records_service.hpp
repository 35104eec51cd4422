#pragma once

#include <google/protobuf/empty.pb.h>

#include "internal/core/capability.hpp"
#include "registrar/services/v1/registrar_records_service.pb.h"
#include "service_context.hpp"

namespace registrar::service {

/*
  Students, courses, enrollments, attendance and grades.

  Every call takes the caller's resolved capabilities; privileged calls
  throw util::PermissionDenied without them. Successful enrollments and
  recorded grades post a notification to the student.
*/
class RecordsService {
public:
  explicit RecordsService(ServiceContext ctx);

  registrar::services::v1::CreateStudentResponse
  CreateStudent(const registrar::core::CapabilitySet& caps, const registrar::services::v1::CreateStudentRequest& req);

  registrar::services::v1::GetStudentResponse
  GetStudent(const registrar::services::v1::GetStudentRequest& req);

  registrar::services::v1::ListStudentsResponse
  ListStudents(const registrar::services::v1::ListStudentsRequest& req);

  void DeleteStudent(const registrar::core::CapabilitySet& caps, const registrar::services::v1::DeleteStudentRequest& req);

  registrar::services::v1::CreateCourseResponse
  CreateCourse(const registrar::core::CapabilitySet& caps, const registrar::services::v1::CreateCourseRequest& req);

  registrar::services::v1::GetCourseResponse
  GetCourse(const registrar::services::v1::GetCourseRequest& req);

  registrar::services::v1::ListCoursesResponse
  ListCourses(const registrar::services::v1::ListCoursesRequest& req);

  void DeleteCourse(const registrar::core::CapabilitySet& caps, const registrar::services::v1::DeleteCourseRequest& req);

  registrar::services::v1::EnrollResponse
  Enroll(const registrar::core::CapabilitySet& caps, const registrar::services::v1::EnrollRequest& req);

  registrar::services::v1::ListEnrollmentsResponse
  ListEnrollments(const registrar::services::v1::ListEnrollmentsRequest& req);

  void DeleteEnrollment(const registrar::core::CapabilitySet& caps, const registrar::services::v1::DeleteEnrollmentRequest& req);

  registrar::services::v1::MarkAttendanceResponse
  MarkAttendance(const registrar::core::CapabilitySet& caps, const registrar::services::v1::MarkAttendanceRequest& req);

  registrar::services::v1::GetAttendanceResponse
  GetAttendance(const registrar::services::v1::GetAttendanceRequest& req);

  registrar::services::v1::RecordGradeResponse
  RecordGrade(const registrar::core::CapabilitySet& caps, const registrar::services::v1::RecordGradeRequest& req);

  registrar::services::v1::GetGradeResponse
  GetGrade(const registrar::services::v1::GetGradeRequest& req);

private:
  // Both log and drop failures; the record change has already committed.
  void PostNotice(const std::string& user_id, const std::string& message, const std::string& type);
  void NotifyGradePosted(const registrar::records::v1::Grade& grade);

  ServiceContext ctx_;
};

}
