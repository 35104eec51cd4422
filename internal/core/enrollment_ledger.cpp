#include "enrollment_ledger.hpp"

#include "internal/core/record_mapping.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace registrar::core {

using namespace registrar::records::v1;

namespace {

std::string EnrollmentKey(const std::string& student_id, const std::string& course_code, const std::string& semester,
                          const std::string& academic_year) {
  return student_id + '\x1f' + course_code + '\x1f' + semester + '\x1f' + academic_year;
}

} // namespace

EnrollmentLedger::EnrollmentLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

Enrollment EnrollmentLedger::Enroll(const CapabilitySet& caps, const std::string& student_id, const std::string& course_code,
                                    const std::string& semester, const std::string& academic_year) {
  caps.Require(Capability::kEnroll, "enroll");
  if (semester.empty()) {
    throw util::ValidationError("semester is required", student_id);
  }
  if (academic_year.empty()) {
    throw util::ValidationError("academic year is required", student_id);
  }

  const auto key  = EnrollmentKey(student_id, course_code, semester, academic_year);
  auto       lock = enrollment_locks_.Lock(key);

  return RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    if (!repository_->GetStudent(tx, student_id)) {
      throw util::NotFound("student not found: " + student_id, student_id);
    }
    if (!repository_->GetCourse(tx, course_code)) {
      throw util::NotFound("course not found: " + course_code, course_code);
    }
    if (repository_->FindEnrollment(tx, student_id, course_code, semester, academic_year)) {
      throw util::DuplicateEnrollment("already enrolled: " + student_id + " in " + course_code + " for " + semester + " " + academic_year,
                                      student_id);
    }

    db::model::EnrollmentRecord record;
    record.student_id    = student_id;
    record.course_code   = course_code;
    record.semester      = semester;
    record.academic_year = academic_year;
    record.created_at_ms = util::ToUnixMillis(util::Now());

    const auto result = repository_->InsertEnrollment(tx, record);
    if (result.IsDuplicate()) {
      throw util::DuplicateEnrollment("already enrolled: " + student_id + " in " + course_code, student_id);
    }
    ThrowIfDbError(result, "insert enrollment", student_id);
    return ToEnrollment(record);
  });
}

std::vector<Enrollment> EnrollmentLedger::ListEnrollments(const std::string& student_id, const std::string& semester,
                                                          const std::string& academic_year) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListEnrollmentsByStudent(*tx, student_id);
  tx->Commit();

  std::vector<Enrollment> out;
  for (const auto& record : records) {
    if (!semester.empty() && record.semester != semester) continue;
    if (!academic_year.empty() && record.academic_year != academic_year) continue;
    out.push_back(ToEnrollment(record));
  }
  return out;
}

Enrollment EnrollmentLedger::GetEnrollment(uint64_t enrollment_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetEnrollment(*tx, enrollment_id);
  tx->Commit();

  if (!record) {
    throw util::NotFound("enrollment not found: " + std::to_string(enrollment_id), std::to_string(enrollment_id));
  }
  return ToEnrollment(*record);
}

void EnrollmentLedger::RemoveEnrollment(db::Transaction& tx, uint64_t enrollment_id) {
  const auto key = std::to_string(enrollment_id);
  ThrowIfDbError(repository_->DeleteGrade(tx, enrollment_id), "delete grade", key);
  ThrowIfDbError(repository_->DeleteEnrollment(tx, enrollment_id), "delete enrollment", key);
}

void EnrollmentLedger::DeleteEnrollment(const CapabilitySet& caps, uint64_t enrollment_id) {
  caps.Require(Capability::kEnroll, "delete enrollment");

  RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    const auto record = repository_->GetEnrollment(tx, enrollment_id);
    if (!record) {
      throw util::NotFound("enrollment not found: " + std::to_string(enrollment_id), std::to_string(enrollment_id));
    }

    RemoveEnrollment(tx, enrollment_id);

    for (const auto& other : repository_->ListEnrollmentsByStudent(tx, record->student_id)) {
      if (other.course_code == record->course_code) {
        return;
      }
    }
    ThrowIfDbError(repository_->DeleteAttendanceByStudentCourse(tx, record->student_id, record->course_code), "delete attendance",
                   record->student_id);
  });
}

void EnrollmentLedger::DeleteStudent(const CapabilitySet& caps, const std::string& student_id) {
  caps.Require(Capability::kManageRecords, "delete student");

  RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    if (!repository_->GetStudent(tx, student_id)) {
      throw util::NotFound("student not found: " + student_id, student_id);
    }

    for (const auto& enrollment : repository_->ListEnrollmentsByStudent(tx, student_id)) {
      RemoveEnrollment(tx, enrollment.id);
    }
    ThrowIfDbError(repository_->DeleteAttendanceByStudent(tx, student_id), "delete attendance", student_id);
    uint64_t notices = 0;
    ThrowIfDbError(repository_->DeleteNotifications(tx, student_id, notices), "delete notifications", student_id);
    ThrowIfDbError(repository_->DeleteStudent(tx, student_id), "delete student", student_id);
  });
}

void EnrollmentLedger::DeleteCourse(const CapabilitySet& caps, const std::string& course_code) {
  caps.Require(Capability::kManageRecords, "delete course");

  RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    if (!repository_->GetCourse(tx, course_code)) {
      throw util::NotFound("course not found: " + course_code, course_code);
    }

    for (const auto& enrollment : repository_->ListEnrollmentsByCourse(tx, course_code)) {
      RemoveEnrollment(tx, enrollment.id);
    }
    ThrowIfDbError(repository_->DeleteAttendanceByCourse(tx, course_code), "delete attendance", course_code);
    ThrowIfDbError(repository_->DeleteCourse(tx, course_code), "delete course", course_code);
  });
}

} // namespace registrar::core
