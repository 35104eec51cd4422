#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace registrar::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Committed state is an immutable snapshot. A transaction that writes
  publishes a new snapshot on Commit() only if nobody else committed in
  between; otherwise Commit() throws TransactionConflict and the caller
  retries.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertStudent(Transaction&, const model::StudentRecord&) override;
  std::optional<model::StudentRecord> GetStudent(Transaction&, const std::string&) override;
  std::vector<model::StudentRecord> ListStudents(Transaction&) override;
  std::vector<std::string> ListStudentIdsWithPrefix(Transaction&, const std::string& prefix) override;
  Result DeleteStudent(Transaction&, const std::string&) override;
  std::optional<uint64_t> GetStudentSequence(Transaction&, int year) override;
  Result SetStudentSequence(Transaction&, int year, uint64_t sequence) override;

  Result InsertCourse(Transaction&, const model::CourseRecord&) override;
  std::optional<model::CourseRecord> GetCourse(Transaction&, const std::string&) override;
  std::vector<model::CourseRecord> ListCourses(Transaction&) override;
  Result DeleteCourse(Transaction&, const std::string&) override;

  Result InsertEnrollment(Transaction&, model::EnrollmentRecord&) override;
  std::optional<model::EnrollmentRecord> GetEnrollment(Transaction&, uint64_t) override;
  std::optional<model::EnrollmentRecord> FindEnrollment(Transaction&, const std::string& student_id,
                                                        const std::string& course_code, const std::string& semester,
                                                        const std::string& academic_year) override;
  std::vector<model::EnrollmentRecord> ListEnrollmentsByStudent(Transaction&, const std::string&) override;
  std::vector<model::EnrollmentRecord> ListEnrollmentsByCourse(Transaction&, const std::string&) override;
  Result DeleteEnrollment(Transaction&, uint64_t) override;

  Result UpsertAttendance(Transaction&, const model::AttendanceRecord&, bool& inserted) override;
  std::vector<model::AttendanceRecord> ListAttendance(Transaction&, const std::string& student_id,
                                                      const std::string& course_code, const std::string& from_date,
                                                      const std::string& to_date) override;
  Result DeleteAttendanceByStudent(Transaction&, const std::string&) override;
  Result DeleteAttendanceByCourse(Transaction&, const std::string&) override;
  Result DeleteAttendanceByStudentCourse(Transaction&, const std::string&, const std::string&) override;

  Result UpsertGrade(Transaction&, const model::GradeRecord&) override;
  std::optional<model::GradeRecord> GetGrade(Transaction&, uint64_t) override;
  Result DeleteGrade(Transaction&, uint64_t) override;

  Result InsertNotification(Transaction&, model::NotificationRecord&) override;
  std::vector<model::NotificationRecord> ListNotifications(Transaction&, const std::string& user_id,
                                                           bool unread_only) override;
  Result MarkNotificationsRead(Transaction&, const std::string& user_id, uint64_t& updated) override;
  Result DeleteNotifications(Transaction&, const std::string& user_id, uint64_t& deleted) override;

  RecordCounts CountRecords(Transaction&) override;
  std::string BackendName() const override { return "memory"; }

private:
  friend class MemoryTransaction;

  using EnrollmentKey = std::tuple<std::string, std::string, std::string, std::string>;
  // (student_id, course_code, date); ordered so range scans come out by date.
  using AttendanceKey = std::tuple<std::string, std::string, std::string>;

  struct State {
    std::map<std::string, model::StudentRecord> students;
    std::map<std::string, model::CourseRecord> courses;
    std::unordered_map<int, uint64_t> student_sequences;

    std::map<uint64_t, model::EnrollmentRecord> enrollments;
    std::map<EnrollmentKey, uint64_t> enrollment_index;
    uint64_t next_enrollment_id = 1;

    std::map<AttendanceKey, model::AttendanceRecord> attendance;
    std::unordered_map<uint64_t, model::GradeRecord> grades;

    std::map<uint64_t, model::NotificationRecord> notifications;
    uint64_t next_notification_id = 1;
  };

  // held by one open transaction at a time
  std::mutex tx_mutex_;
  std::shared_ptr<const State> committed_;
};

}
