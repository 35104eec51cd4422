#include "attendance_register.hpp"

#include "internal/core/record_mapping.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace registrar::core {

using namespace registrar::records::v1;

namespace {

bool IsMarkableStatus(AttendanceStatus status) {
  switch (status) {
    case ATTENDANCE_STATUS_PRESENT:
    case ATTENDANCE_STATUS_ABSENT:
    case ATTENDANCE_STATUS_LATE:
    case ATTENDANCE_STATUS_EXCUSED:
      return true;
    default:
      return false;
  }
}

} // namespace

AttendanceRegister::AttendanceRegister(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void AttendanceRegister::ValidateRange(const std::string& from_date, const std::string& to_date) {
  if (!from_date.empty() && !util::IsIsoDate(from_date)) {
    throw util::ValidationError("range start must be YYYY-MM-DD", from_date);
  }
  if (!to_date.empty() && !util::IsIsoDate(to_date)) {
    throw util::ValidationError("range end must be YYYY-MM-DD", to_date);
  }
}

std::vector<MarkResult> AttendanceRegister::MarkAttendance(const CapabilitySet& caps, const std::string& course_code, const std::string& date,
                                                           const std::vector<AttendanceEntry>& entries) {
  caps.Require(Capability::kMarkAttendance, "mark attendance");
  if (!util::IsIsoDate(date)) {
    throw util::ValidationError("attendance date must be YYYY-MM-DD", date);
  }
  for (const auto& entry : entries) {
    if (!IsMarkableStatus(entry.status)) {
      throw util::ValidationError("attendance status must be present, absent, late or excused", entry.student_id);
    }
  }

  {
    auto tx     = repository_->Begin();
    auto course = repository_->GetCourse(*tx, course_code);
    tx->Commit();
    if (!course) {
      throw util::NotFound("course not found: " + course_code, course_code);
    }
  }

  std::vector<MarkResult> results;
  results.reserve(entries.size());

  for (const auto& entry : entries) {
    auto lock = attendance_locks_.Lock(entry.student_id + '\x1f' + course_code + '\x1f' + date);

    const bool inserted = RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
      if (!repository_->GetStudent(tx, entry.student_id)) {
        throw util::NotFound("student not found: " + entry.student_id, entry.student_id);
      }
      if (!repository_->GetCourse(tx, course_code)) {
        throw util::NotFound("course not found: " + course_code, course_code);
      }

      db::model::AttendanceRecord record;
      record.student_id  = entry.student_id;
      record.course_code = course_code;
      record.date        = date;
      record.status      = entry.status;
      record.remark      = entry.remark;

      bool created = false;
      ThrowIfDbError(repository_->UpsertAttendance(tx, record, created), "upsert attendance", entry.student_id);
      return created;
    });

    results.push_back(MarkResult{entry.student_id, inserted});
  }

  return results;
}

std::vector<Attendance> AttendanceRegister::GetAttendance(const std::string& student_id, const std::string& course_code,
                                                          const std::string& from_date, const std::string& to_date) {
  ValidateRange(from_date, to_date);

  auto tx      = repository_->Begin();
  auto records = repository_->ListAttendance(*tx, student_id, course_code, from_date, to_date);
  tx->Commit();

  std::vector<Attendance> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToAttendance(record));
  }
  return out;
}

} // namespace registrar::core
