#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace registrar::db::memory {

namespace {

bool InRange(const std::string& date, const std::string& from_date, const std::string& to_date) {
  if (!from_date.empty() && date < from_date) return false;
  if (!to_date.empty() && date > to_date) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Students
// ------------------------------------------------------------------

Result MemoryRepository::InsertStudent(Transaction& t, const model::StudentRecord& r) {
  if (TX(t).View().students.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "student " + r.id);
  TX(t).Mutable().students[r.id] = r;
  return Result::Ok();
}

std::optional<model::StudentRecord> MemoryRepository::GetStudent(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.students.find(id);
  if (it == s.students.end()) return std::nullopt;
  return it->second;
}

std::vector<model::StudentRecord> MemoryRepository::ListStudents(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::StudentRecord> records;
  records.reserve(s.students.size());
  for (const auto& [_, record] : s.students) {
    records.push_back(record);
  }
  return records;
}

std::vector<std::string> MemoryRepository::ListStudentIdsWithPrefix(Transaction& t, const std::string& prefix) {
  std::vector<std::string> out;
  const auto&              s = TX(t).View();
  for (auto it = s.students.lower_bound(prefix); it != s.students.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    out.push_back(it->first);
  }
  return out;
}

Result MemoryRepository::DeleteStudent(Transaction& t, const std::string& id) {
  if (TX(t).View().students.contains(id)) {
    TX(t).Mutable().students.erase(id);
  }
  return Result::Ok();
}

std::optional<uint64_t> MemoryRepository::GetStudentSequence(Transaction& t, int year) {
  const auto& s  = TX(t).View();
  auto        it = s.student_sequences.find(year);
  if (it == s.student_sequences.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetStudentSequence(Transaction& t, int year, uint64_t sequence) {
  TX(t).Mutable().student_sequences[year] = sequence;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Courses
// ------------------------------------------------------------------

Result MemoryRepository::InsertCourse(Transaction& t, const model::CourseRecord& r) {
  if (TX(t).View().courses.contains(r.code)) return Result::Err(ErrorCode::AlreadyExists, "course " + r.code);
  TX(t).Mutable().courses[r.code] = r;
  return Result::Ok();
}

std::optional<model::CourseRecord> MemoryRepository::GetCourse(Transaction& t, const std::string& code) {
  const auto& s  = TX(t).View();
  auto        it = s.courses.find(code);
  if (it == s.courses.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CourseRecord> MemoryRepository::ListCourses(Transaction& t) {
  std::vector<model::CourseRecord> out;
  for (const auto& [_, record] : TX(t).View().courses) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteCourse(Transaction& t, const std::string& code) {
  if (TX(t).View().courses.contains(code)) {
    TX(t).Mutable().courses.erase(code);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Enrollments
// ------------------------------------------------------------------

Result MemoryRepository::InsertEnrollment(Transaction& t, model::EnrollmentRecord& r) {
  const EnrollmentKey key{r.student_id, r.course_code, r.semester, r.academic_year};
  if (TX(t).View().enrollment_index.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "enrollment " + r.student_id + "/" + r.course_code);
  }

  auto& s = TX(t).Mutable();
  r.id    = s.next_enrollment_id++;
  s.enrollments[r.id]     = r;
  s.enrollment_index[key] = r.id;
  return Result::Ok();
}

std::optional<model::EnrollmentRecord> MemoryRepository::GetEnrollment(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.enrollments.find(id);
  if (it == s.enrollments.end()) return std::nullopt;
  return it->second;
}

std::optional<model::EnrollmentRecord> MemoryRepository::FindEnrollment(Transaction& t, const std::string& student_id,
                                                                        const std::string& course_code, const std::string& semester,
                                                                        const std::string& academic_year) {
  const auto& s  = TX(t).View();
  auto        it = s.enrollment_index.find(EnrollmentKey{student_id, course_code, semester, academic_year});
  if (it == s.enrollment_index.end()) return std::nullopt;
  return s.enrollments.at(it->second);
}

std::vector<model::EnrollmentRecord> MemoryRepository::ListEnrollmentsByStudent(Transaction& t, const std::string& student_id) {
  std::vector<model::EnrollmentRecord> out;
  for (const auto& [_, e] : TX(t).View().enrollments)
    if (e.student_id == student_id) out.push_back(e);
  return out;
}

std::vector<model::EnrollmentRecord> MemoryRepository::ListEnrollmentsByCourse(Transaction& t, const std::string& course_code) {
  std::vector<model::EnrollmentRecord> out;
  for (const auto& [_, e] : TX(t).View().enrollments)
    if (e.course_code == course_code) out.push_back(e);
  return out;
}

Result MemoryRepository::DeleteEnrollment(Transaction& t, uint64_t id) {
  const auto& view = TX(t).View();
  auto        it   = view.enrollments.find(id);
  if (it == view.enrollments.end()) {
    return Result::Ok();
  }

  const EnrollmentKey key{it->second.student_id, it->second.course_code, it->second.semester, it->second.academic_year};
  auto&               s = TX(t).Mutable();
  s.enrollment_index.erase(key);
  s.enrollments.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Attendance
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAttendance(Transaction& t, const model::AttendanceRecord& r, bool& inserted) {
  auto& rows = TX(t).Mutable().attendance;
  auto [it, created] = rows.insert_or_assign(AttendanceKey{r.student_id, r.course_code, r.date}, r);
  inserted = created;
  return Result::Ok();
}

std::vector<model::AttendanceRecord> MemoryRepository::ListAttendance(Transaction& t, const std::string& student_id,
                                                                      const std::string& course_code, const std::string& from_date,
                                                                      const std::string& to_date) {
  std::vector<model::AttendanceRecord> out;
  const auto&                          rows = TX(t).View().attendance;
  for (auto it = rows.lower_bound(AttendanceKey{student_id, course_code, from_date}); it != rows.end(); ++it) {
    const auto& [sid, code, date] = it->first;
    if (sid != student_id || code != course_code) break;
    if (!InRange(date, from_date, to_date)) {
      if (!to_date.empty() && date > to_date) break;
      continue;
    }
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::DeleteAttendanceByStudent(Transaction& t, const std::string& student_id) {
  auto& rows = TX(t).Mutable().attendance;
  std::erase_if(rows, [&](const auto& row) { return row.second.student_id == student_id; });
  return Result::Ok();
}

Result MemoryRepository::DeleteAttendanceByCourse(Transaction& t, const std::string& course_code) {
  auto& rows = TX(t).Mutable().attendance;
  std::erase_if(rows, [&](const auto& row) { return row.second.course_code == course_code; });
  return Result::Ok();
}

Result MemoryRepository::DeleteAttendanceByStudentCourse(Transaction& t, const std::string& student_id, const std::string& course_code) {
  auto& rows = TX(t).Mutable().attendance;
  std::erase_if(rows, [&](const auto& row) { return row.second.student_id == student_id && row.second.course_code == course_code; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Grades
// ------------------------------------------------------------------

Result MemoryRepository::UpsertGrade(Transaction& t, const model::GradeRecord& r) {
  TX(t).Mutable().grades[r.enrollment_id] = r;
  return Result::Ok();
}

std::optional<model::GradeRecord> MemoryRepository::GetGrade(Transaction& t, uint64_t enrollment_id) {
  const auto& s  = TX(t).View();
  auto        it = s.grades.find(enrollment_id);
  if (it == s.grades.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteGrade(Transaction& t, uint64_t enrollment_id) {
  if (TX(t).View().grades.contains(enrollment_id)) {
    TX(t).Mutable().grades.erase(enrollment_id);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result MemoryRepository::InsertNotification(Transaction& t, model::NotificationRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_notification_id++;
  s.notifications[r.id] = r;
  return Result::Ok();
}

std::vector<model::NotificationRecord> MemoryRepository::ListNotifications(Transaction& t, const std::string& user_id, bool unread_only) {
  std::vector<model::NotificationRecord> out;
  const auto&                            rows = TX(t).View().notifications;
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
    if (it->second.user_id != user_id) continue;
    if (unread_only && it->second.read) continue;
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::MarkNotificationsRead(Transaction& t, const std::string& user_id, uint64_t& updated) {
  updated = 0;
  for (auto& [_, n] : TX(t).Mutable().notifications) {
    if (n.user_id == user_id && !n.read) {
      n.read = true;
      ++updated;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteNotifications(Transaction& t, const std::string& user_id, uint64_t& deleted) {
  deleted = std::erase_if(TX(t).Mutable().notifications, [&](const auto& row) { return row.second.user_id == user_id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Admin
// ------------------------------------------------------------------

RecordCounts MemoryRepository::CountRecords(Transaction& t) {
  const auto&  s = TX(t).View();
  RecordCounts counts;
  counts.students           = s.students.size();
  counts.courses            = s.courses.size();
  counts.enrollments        = s.enrollments.size();
  counts.attendance_records = s.attendance.size();
  counts.grades             = s.grades.size();
  counts.notifications      = s.notifications.size();
  return counts;
}

} // namespace registrar::db::memory
