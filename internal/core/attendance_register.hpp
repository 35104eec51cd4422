#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/capability.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/key_locks.hpp"
#include "registrar/records/v1/types.pb.h"

namespace registrar::core {

struct AttendanceEntry {
  std::string                              student_id;
  registrar::records::v1::AttendanceStatus status = registrar::records::v1::ATTENDANCE_STATUS_UNSPECIFIED;
  std::string                              remark;
};

struct MarkResult {
  std::string student_id;
  bool        inserted = false;
};

/*
  Per-day attendance keyed on (student, course, date).

  Marking is an upsert: re-marking a day replaces its status and remark.
  A batch is applied entry by entry, each in its own transaction, so an
  entry that fails leaves the earlier ones committed.
*/
class AttendanceRegister {
 public:
  explicit AttendanceRegister(std::shared_ptr<db::Repository> repository);

  std::vector<MarkResult> MarkAttendance(const CapabilitySet& caps, const std::string& course_code, const std::string& date,
                                         const std::vector<AttendanceEntry>& entries);

  // Inclusive range, empty bound = open. Ordered by date ascending.
  std::vector<registrar::records::v1::Attendance> GetAttendance(const std::string& student_id, const std::string& course_code,
                                                                const std::string& from_date, const std::string& to_date);

  // Throws util::ValidationError for a malformed non-empty bound.
  static void ValidateRange(const std::string& from_date, const std::string& to_date);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::KeyLocks<>                attendance_locks_;
};

} // namespace registrar::core
