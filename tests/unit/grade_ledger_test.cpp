#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/core/capability.hpp"
#include "internal/core/enrollment_ledger.hpp"
#include "internal/core/grade_ledger.hpp"
#include "internal/core/identity_allocator.hpp"
#include "internal/core/records_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using registrar::core::Capability;
using registrar::core::CapabilitySet;
using registrar::core::DeriveLetterGrade;
using registrar::core::EnrollmentLedger;
using registrar::core::GradeLedger;
using registrar::core::GradePoints;
using registrar::core::IdentityAllocator;
using registrar::core::RecordsCatalog;
using registrar::core::ToHundredths;
using registrar::db::memory::MemoryRepository;
using namespace registrar::records::v1;

struct Fixture {
  std::shared_ptr<MemoryRepository>  repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<IdentityAllocator> allocator = std::make_shared<IdentityAllocator>(repo, 5);
  RecordsCatalog                     catalog{repo, allocator};
  EnrollmentLedger                   ledger{repo};
  GradeLedger                        grades{repo};
  CapabilitySet                      caps = CapabilitySet::All();
  uint64_t                           enrollment_id = 0;

  Fixture() {
    StudentProfile profile;
    profile.set_name("Katherine");
    profile.set_gender(GENDER_FEMALE);
    const auto sid = catalog.CreateStudent(caps, profile, 2024).id();

    Course course;
    course.set_code("MATH301");
    course.set_name("Orbital Mechanics");
    course.set_credit_hours(4);
    catalog.CreateCourse(caps, course);

    enrollment_id = ledger.Enroll(caps, sid, "MATH301", "Fall", "2024-2025").id();
  }

  LetterGrade Record(double marks) {
    return grades.RecordGrade(caps, enrollment_id, marks, "").letter();
  }
};

bool RejectsScore(Fixture& f, double marks) {
  try {
    f.grades.RecordGrade(f.caps, f.enrollment_id, marks, "");
  } catch (const registrar::util::InvalidScore&) {
    return true;
  }
  return false;
}

void TestLetterBoundaries() {
  assert(DeriveLetterGrade(ToHundredths(100.0)) == LETTER_GRADE_A);
  assert(DeriveLetterGrade(ToHundredths(90.0)) == LETTER_GRADE_A);
  assert(DeriveLetterGrade(ToHundredths(89.99)) == LETTER_GRADE_B);
  assert(DeriveLetterGrade(ToHundredths(80.0)) == LETTER_GRADE_B);
  assert(DeriveLetterGrade(ToHundredths(79.99)) == LETTER_GRADE_C);
  assert(DeriveLetterGrade(ToHundredths(70.0)) == LETTER_GRADE_C);
  assert(DeriveLetterGrade(ToHundredths(60.0)) == LETTER_GRADE_D);
  assert(DeriveLetterGrade(ToHundredths(59.99)) == LETTER_GRADE_F);
  assert(DeriveLetterGrade(ToHundredths(0.0)) == LETTER_GRADE_F);

  // Marks are kept to two decimals before classification.
  assert(ToHundredths(79.996) == 8000);
  assert(DeriveLetterGrade(ToHundredths(79.996)) == LETTER_GRADE_B);
  assert(ToHundredths(93.994) == 9399);
}

void TestGradePoints() {
  assert(GradePoints(LETTER_GRADE_A) == 4);
  assert(GradePoints(LETTER_GRADE_B) == 3);
  assert(GradePoints(LETTER_GRADE_C) == 2);
  assert(GradePoints(LETTER_GRADE_D) == 1);
  assert(GradePoints(LETTER_GRADE_F) == 0);
}

void TestRecordDerivesLetter() {
  Fixture f;

  const auto grade = f.grades.RecordGrade(f.caps, f.enrollment_id, 93.0, "solid work");
  assert(grade.enrollment_id() == f.enrollment_id);
  assert(grade.letter() == LETTER_GRADE_A);
  assert(grade.marks() == 93.0);
  assert(grade.remark() == "solid work");
  assert(grade.has_recorded_at());

  assert(f.Record(89.99) == LETTER_GRADE_B);
  assert(f.Record(60.0) == LETTER_GRADE_D);
  assert(f.Record(59.99) == LETTER_GRADE_F);
  assert(f.Record(100.0) == LETTER_GRADE_A);
  assert(f.Record(0.0) == LETTER_GRADE_F);
}

void TestRecordingAgainReplaces() {
  Fixture f;

  f.grades.RecordGrade(f.caps, f.enrollment_id, 72.5, "first pass");
  f.grades.RecordGrade(f.caps, f.enrollment_id, 84.25, "regraded");

  const auto grade = f.grades.GetGrade(f.enrollment_id);
  assert(grade.marks() == 84.25);
  assert(grade.letter() == LETTER_GRADE_B);
  assert(grade.remark() == "regraded");
}

void TestOutOfRangeMarksAreRejected() {
  Fixture f;

  assert(RejectsScore(f, -1.0));
  assert(RejectsScore(f, -0.01));
  assert(RejectsScore(f, 100.01));
  assert(RejectsScore(f, std::numeric_limits<double>::quiet_NaN()));
  assert(RejectsScore(f, std::numeric_limits<double>::infinity()));

  bool missing = false;
  try {
    (void)f.grades.GetGrade(f.enrollment_id);
  } catch (const registrar::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestUnknownEnrollmentAndCapability() {
  Fixture f;

  bool not_found = false;
  try {
    f.grades.RecordGrade(f.caps, f.enrollment_id + 100, 75.0, "");
  } catch (const registrar::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  CapabilitySet marker;
  marker.Grant(Capability::kMarkAttendance);
  bool denied = false;
  try {
    f.grades.RecordGrade(marker, f.enrollment_id, 75.0, "");
  } catch (const registrar::util::PermissionDenied&) {
    denied = true;
  }
  assert(denied);
}

} // namespace

int main() {
  TestLetterBoundaries();
  TestGradePoints();
  TestRecordDerivesLetter();
  TestRecordingAgainReplaces();
  TestOutOfRangeMarksAreRejected();
  TestUnknownEnrollmentAndCapability();

  std::cout << "registrar_unit_grade_ledger: pass\n";
  return 0;
}
