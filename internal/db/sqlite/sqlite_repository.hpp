#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace registrar::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates missing tables and indexes in one transaction. Safe to call
  // on every startup.
  void BootstrapSchema();

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
  std::string BackendName() const override { return "sqlite"; }

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
