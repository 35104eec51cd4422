#include "records_service.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "internal/core/attendance_register.hpp"
#include "internal/core/enrollment_ledger.hpp"
#include "internal/core/grade_ledger.hpp"
#include "internal/core/notification_center.hpp"
#include "internal/core/records_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "registrar/v1.hpp"

namespace registrar::service {

using namespace registrar::v1;

namespace {

std::string FormatMarks(double marks) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << marks;
  return out.str();
}

} // namespace

RecordsService::RecordsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void RecordsService::PostNotice(const std::string& user_id, const std::string& message, const std::string& type) {
  try {
    ctx_.notifications->Notify(user_id, message, type);
  } catch (const std::exception& ex) {
    REGISTRAR_LOG_WARN("notification not posted", {registrar::observability::StringField("user_id", user_id),
                                                   registrar::observability::StringField("type", type),
                                                   registrar::observability::StringField("error", ex.what())});
  }
}

void RecordsService::NotifyGradePosted(const Grade& grade) {
  try {
    const auto enrollment = ctx_.enrollments->GetEnrollment(grade.enrollment_id());
    PostNotice(enrollment.student_id(),
               "Your grade for " + enrollment.course_code() + " has been posted: " + FormatMarks(grade.marks()) + " (" +
                   core::LetterSymbol(grade.letter()) + ").",
               "grade");
  } catch (const std::exception& ex) {
    REGISTRAR_LOG_WARN("grade notification not posted", {registrar::observability::IntField("enrollment_id", static_cast<std::int64_t>(grade.enrollment_id())),
                                                         registrar::observability::StringField("error", ex.what())});
  }
}

// ------------------------------------------------------------------
// Students
// ------------------------------------------------------------------

CreateStudentResponse RecordsService::CreateStudent(const core::CapabilitySet& caps, const CreateStudentRequest& req) {
  return ObserveRpc("RecordsService.CreateStudent", [&] {
    const int year = req.year() == 0 ? util::CurrentYear() : req.year();

    CreateStudentResponse resp;
    *resp.mutable_student() = ctx_.catalog->CreateStudent(caps, req.profile(), year);
    REGISTRAR_LOG_INFO("student created", {registrar::observability::StringField("student_id", resp.student().id())});
    return resp;
  });
}

GetStudentResponse RecordsService::GetStudent(const GetStudentRequest& req) {
  return ObserveRpc("RecordsService.GetStudent", [&] {
    GetStudentResponse resp;
    *resp.mutable_student() = ctx_.catalog->GetStudent(req.student_id());
    return resp;
  });
}

ListStudentsResponse RecordsService::ListStudents(const ListStudentsRequest&) {
  return ObserveRpc("RecordsService.ListStudents", [&] {
    ListStudentsResponse resp;
    for (auto& student : ctx_.catalog->ListStudents()) {
      *resp.add_students() = std::move(student);
    }
    return resp;
  });
}

void RecordsService::DeleteStudent(const core::CapabilitySet& caps, const DeleteStudentRequest& req) {
  ObserveRpc("RecordsService.DeleteStudent", [&] {
    ctx_.enrollments->DeleteStudent(caps, req.student_id());
    REGISTRAR_LOG_INFO("student deleted", {registrar::observability::StringField("student_id", req.student_id())});
  });
}

// ------------------------------------------------------------------
// Courses
// ------------------------------------------------------------------

CreateCourseResponse RecordsService::CreateCourse(const core::CapabilitySet& caps, const CreateCourseRequest& req) {
  return ObserveRpc("RecordsService.CreateCourse", [&] {
    CreateCourseResponse resp;
    *resp.mutable_course() = ctx_.catalog->CreateCourse(caps, req.course());
    return resp;
  });
}

GetCourseResponse RecordsService::GetCourse(const GetCourseRequest& req) {
  return ObserveRpc("RecordsService.GetCourse", [&] {
    GetCourseResponse resp;
    *resp.mutable_course() = ctx_.catalog->GetCourse(req.course_code());
    return resp;
  });
}

ListCoursesResponse RecordsService::ListCourses(const ListCoursesRequest&) {
  return ObserveRpc("RecordsService.ListCourses", [&] {
    ListCoursesResponse resp;
    for (auto& course : ctx_.catalog->ListCourses()) {
      *resp.add_courses() = std::move(course);
    }
    return resp;
  });
}

void RecordsService::DeleteCourse(const core::CapabilitySet& caps, const DeleteCourseRequest& req) {
  ObserveRpc("RecordsService.DeleteCourse", [&] {
    ctx_.enrollments->DeleteCourse(caps, req.course_code());
    REGISTRAR_LOG_INFO("course deleted", {registrar::observability::StringField("course_code", req.course_code())});
  });
}

// ------------------------------------------------------------------
// Enrollments
// ------------------------------------------------------------------

EnrollResponse RecordsService::Enroll(const core::CapabilitySet& caps, const EnrollRequest& req) {
  return ObserveRpc("RecordsService.Enroll", [&] {
    EnrollResponse resp;
    *resp.mutable_enrollment() = ctx_.enrollments->Enroll(caps, req.student_id(), req.course_code(), req.semester(), req.academic_year());

    PostNotice(req.student_id(),
               "You have been enrolled in " + req.course_code() + " for " + req.semester() + " " + req.academic_year() + ".",
               "enrollment");
    return resp;
  });
}

ListEnrollmentsResponse RecordsService::ListEnrollments(const ListEnrollmentsRequest& req) {
  return ObserveRpc("RecordsService.ListEnrollments", [&] {
    ListEnrollmentsResponse resp;
    for (auto& enrollment : ctx_.enrollments->ListEnrollments(req.student_id(), req.semester(), req.academic_year())) {
      *resp.add_enrollments() = std::move(enrollment);
    }
    return resp;
  });
}

void RecordsService::DeleteEnrollment(const core::CapabilitySet& caps, const DeleteEnrollmentRequest& req) {
  ObserveRpc("RecordsService.DeleteEnrollment", [&] { ctx_.enrollments->DeleteEnrollment(caps, req.enrollment_id()); });
}

// ------------------------------------------------------------------
// Attendance
// ------------------------------------------------------------------

MarkAttendanceResponse RecordsService::MarkAttendance(const core::CapabilitySet& caps, const MarkAttendanceRequest& req) {
  return ObserveRpc("RecordsService.MarkAttendance", [&] {
    std::vector<core::AttendanceEntry> entries;
    entries.reserve(static_cast<std::size_t>(req.entries_size()));
    for (const auto& entry : req.entries()) {
      entries.push_back(core::AttendanceEntry{entry.student_id(), entry.status(), entry.remark()});
    }

    MarkAttendanceResponse resp;
    std::uint64_t          inserted = 0;
    for (const auto& result : ctx_.attendance->MarkAttendance(caps, req.course_code(), req.date(), entries)) {
      auto* out = resp.add_results();
      out->set_student_id(result.student_id);
      out->set_outcome(result.inserted ? MARK_OUTCOME_INSERTED : MARK_OUTCOME_UPDATED);
      inserted += result.inserted ? 1 : 0;
    }
    registrar::observability::Metrics::Instance().RecordAttendanceMarks(inserted, static_cast<std::uint64_t>(resp.results_size()) - inserted);
    return resp;
  });
}

GetAttendanceResponse RecordsService::GetAttendance(const GetAttendanceRequest& req) {
  return ObserveRpc("RecordsService.GetAttendance", [&] {
    GetAttendanceResponse resp;
    for (auto& record : ctx_.attendance->GetAttendance(req.student_id(), req.course_code(), req.range().from(), req.range().to())) {
      *resp.add_records() = std::move(record);
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Grades
// ------------------------------------------------------------------

RecordGradeResponse RecordsService::RecordGrade(const core::CapabilitySet& caps, const RecordGradeRequest& req) {
  return ObserveRpc("RecordsService.RecordGrade", [&] {
    RecordGradeResponse resp;
    *resp.mutable_grade() = ctx_.grades->RecordGrade(caps, req.enrollment_id(), req.marks(), req.remark());
    REGISTRAR_LOG_INFO("grade recorded", {registrar::observability::IntField("enrollment_id", static_cast<std::int64_t>(req.enrollment_id())),
                                          registrar::observability::ScoreField("marks", resp.grade().marks()),
                                          registrar::observability::StringField("letter", std::string(1, core::LetterSymbol(resp.grade().letter())))});
    registrar::observability::Metrics::Instance().RecordGradePosted(core::LetterSymbol(resp.grade().letter()));

    NotifyGradePosted(resp.grade());
    return resp;
  });
}

GetGradeResponse RecordsService::GetGrade(const GetGradeRequest& req) {
  return ObserveRpc("RecordsService.GetGrade", [&] {
    GetGradeResponse resp;
    *resp.mutable_grade() = ctx_.grades->GetGrade(req.enrollment_id());
    return resp;
  });
}

}
