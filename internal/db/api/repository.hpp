#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/attendance_record.hpp"
#include "internal/db/model/course_record.hpp"
#include "internal/db/model/enrollment_record.hpp"
#include "internal/db/model/grade_record.hpp"
#include "internal/db/model/notification_record.hpp"
#include "internal/db/model/student_record.hpp"

namespace registrar::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Unique keys are enforced by the store itself:
      students(id), courses(code),
      enrollments(student_id, course_code, semester, academic_year),
      attendance(student_id, course_code, date),
      grades(enrollment_id)
  - Deletes are idempotent; cascades are the caller's job

  The DB is the source of truth for every academic record.
*/

struct RecordCounts {
  uint64_t students           = 0;
  uint64_t courses            = 0;
  uint64_t enrollments        = 0;
  uint64_t attendance_records = 0;
  uint64_t grades             = 0;
  uint64_t notifications      = 0;
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Students
  // ---------------------------------------------------------------------

  virtual Result InsertStudent(Transaction&, const model::StudentRecord&) = 0;

  virtual std::optional<model::StudentRecord> GetStudent(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::StudentRecord> ListStudents(Transaction&) = 0;

  // Ids starting with prefix, in no particular order.
  virtual std::vector<std::string> ListStudentIdsWithPrefix(Transaction&, const std::string& prefix) = 0;

  virtual Result DeleteStudent(Transaction&, const std::string& id) = 0;

  // Highest sequence ever handed out for a year (survives student deletion).
  virtual std::optional<uint64_t> GetStudentSequence(Transaction&, int year) = 0;

  virtual Result SetStudentSequence(Transaction&, int year, uint64_t sequence) = 0;

  // ---------------------------------------------------------------------
  // Courses
  // ---------------------------------------------------------------------

  virtual Result InsertCourse(Transaction&, const model::CourseRecord&) = 0;

  virtual std::optional<model::CourseRecord> GetCourse(Transaction&, const std::string& code) = 0;

  virtual std::vector<model::CourseRecord> ListCourses(Transaction&) = 0;

  virtual Result DeleteCourse(Transaction&, const std::string& code) = 0;

  // ---------------------------------------------------------------------
  // Enrollments
  // ---------------------------------------------------------------------

  // Assigns record.id. Duplicate 4-tuple -> AlreadyExists.
  virtual Result InsertEnrollment(Transaction&, model::EnrollmentRecord&) = 0;

  virtual std::optional<model::EnrollmentRecord> GetEnrollment(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::EnrollmentRecord> FindEnrollment(Transaction&, const std::string& student_id, const std::string& course_code,
                                                                const std::string& semester, const std::string& academic_year) = 0;

  // Ordered by id.
  virtual std::vector<model::EnrollmentRecord> ListEnrollmentsByStudent(Transaction&, const std::string& student_id) = 0;

  virtual std::vector<model::EnrollmentRecord> ListEnrollmentsByCourse(Transaction&, const std::string& course_code) = 0;

  virtual Result DeleteEnrollment(Transaction&, uint64_t id) = 0;

  // ---------------------------------------------------------------------
  // Attendance
  // ---------------------------------------------------------------------

  // Insert-or-replace on (student_id, course_code, date).
  // inserted is set to false when an existing row was overwritten.
  virtual Result UpsertAttendance(Transaction&, const model::AttendanceRecord&, bool& inserted) = 0;

  // Inclusive bounds; empty bound means unbounded. Ordered by date ascending.
  virtual std::vector<model::AttendanceRecord> ListAttendance(Transaction&, const std::string& student_id, const std::string& course_code,
                                                              const std::string& from_date, const std::string& to_date) = 0;

  virtual Result DeleteAttendanceByStudent(Transaction&, const std::string& student_id) = 0;

  virtual Result DeleteAttendanceByCourse(Transaction&, const std::string& course_code) = 0;

  virtual Result DeleteAttendanceByStudentCourse(Transaction&, const std::string& student_id, const std::string& course_code) = 0;

  // ---------------------------------------------------------------------
  // Grades
  // ---------------------------------------------------------------------

  virtual Result UpsertGrade(Transaction&, const model::GradeRecord&) = 0;

  virtual std::optional<model::GradeRecord> GetGrade(Transaction&, uint64_t enrollment_id) = 0;

  virtual Result DeleteGrade(Transaction&, uint64_t enrollment_id) = 0;

  // ---------------------------------------------------------------------
  // Notifications
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertNotification(Transaction&, model::NotificationRecord&) = 0;

  // Newest first.
  virtual std::vector<model::NotificationRecord> ListNotifications(Transaction&, const std::string& user_id, bool unread_only) = 0;

  virtual Result MarkNotificationsRead(Transaction&, const std::string& user_id, uint64_t& updated) = 0;

  virtual Result DeleteNotifications(Transaction&, const std::string& user_id, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Admin
  // ---------------------------------------------------------------------

  virtual RecordCounts CountRecords(Transaction&) = 0;

  // Short backend name reported by the admin service ("memory", "sqlite").
  virtual std::string BackendName() const = 0;
};

} // namespace registrar::db
