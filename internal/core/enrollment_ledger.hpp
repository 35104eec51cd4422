#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/capability.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/key_locks.hpp"
#include "registrar/records/v1/types.pb.h"

namespace registrar::core {

/*
  Enrollments and the deletes that cascade through them.

  (student, course, semester, academic year) is unique. Enroll checks and
  inserts under a per-tuple lock inside one transaction; the store's unique
  index is the final guard.

  Cascades are explicit: enrollment -> grade -> enrollment row, then the
  attendance rows, then the owning entity. Every step is idempotent.
*/
class EnrollmentLedger {
 public:
  explicit EnrollmentLedger(std::shared_ptr<db::Repository> repository);

  registrar::records::v1::Enrollment Enroll(const CapabilitySet& caps, const std::string& student_id, const std::string& course_code,
                                            const std::string& semester, const std::string& academic_year);

  // Empty semester / academic_year match everything. Ordered by id.
  std::vector<registrar::records::v1::Enrollment> ListEnrollments(const std::string& student_id, const std::string& semester,
                                                                  const std::string& academic_year);

  registrar::records::v1::Enrollment GetEnrollment(uint64_t enrollment_id);

  // Drops the grade and the enrollment. Attendance for (student, course) goes
  // too unless another enrollment still links them.
  void DeleteEnrollment(const CapabilitySet& caps, uint64_t enrollment_id);

  // Also removes the student's attendance and notifications.
  void DeleteStudent(const CapabilitySet& caps, const std::string& student_id);
  void DeleteCourse(const CapabilitySet& caps, const std::string& course_code);

 private:
  void RemoveEnrollment(db::Transaction& tx, uint64_t enrollment_id);

  std::shared_ptr<db::Repository> repository_;
  util::KeyLocks<>                enrollment_locks_;
};

} // namespace registrar::core
