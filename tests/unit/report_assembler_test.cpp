#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/attendance_register.hpp"
#include "internal/core/capability.hpp"
#include "internal/core/enrollment_ledger.hpp"
#include "internal/core/grade_ledger.hpp"
#include "internal/core/identity_allocator.hpp"
#include "internal/core/records_catalog.hpp"
#include "internal/core/report_assembler.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using registrar::core::AttendanceEntry;
using registrar::core::AttendanceRegister;
using registrar::core::CapabilitySet;
using registrar::core::EnrollmentLedger;
using registrar::core::GradeLedger;
using registrar::core::IdentityAllocator;
using registrar::core::RecordsCatalog;
using registrar::core::ReportAssembler;
using registrar::db::memory::MemoryRepository;
using namespace registrar::records::v1;

struct Fixture {
  std::shared_ptr<MemoryRepository>  repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<IdentityAllocator> allocator = std::make_shared<IdentityAllocator>(repo, 5);
  RecordsCatalog                     catalog{repo, allocator};
  EnrollmentLedger                   ledger{repo};
  AttendanceRegister                 attendance{repo};
  GradeLedger                        grades{repo};
  ReportAssembler                    reports{repo};
  CapabilitySet                      caps = CapabilitySet::All();
  std::string                        sid;

  Fixture() {
    StudentProfile profile;
    profile.set_name("Dorothy Vaughan");
    profile.set_gender(GENDER_FEMALE);
    sid = catalog.CreateStudent(caps, profile, 2024).id();
  }

  void AddCourse(const std::string& code, uint32_t credits) {
    Course course;
    course.set_code(code);
    course.set_name("Course " + code);
    course.set_credit_hours(credits);
    catalog.CreateCourse(caps, course);
  }

  uint64_t Enroll(const std::string& code, const std::string& semester) {
    return ledger.Enroll(caps, sid, code, semester, "2024-2025").id();
  }

  void Mark(const std::string& date, AttendanceStatus status) {
    attendance.MarkAttendance(caps, "CS101", date, {AttendanceEntry{sid, status, ""}});
  }
};

void TestGpaIsCreditWeighted() {
  Fixture f;
  f.AddCourse("CS101", 3);
  f.AddCourse("CS102", 3);

  f.grades.RecordGrade(f.caps, f.Enroll("CS101", "Fall"), 95.0, "excellent");
  f.grades.RecordGrade(f.caps, f.Enroll("CS102", "Fall"), 72.0, "");

  const auto card = f.reports.BuildReportCard(f.sid, "Fall", "2024-2025");
  assert(card.student_id() == f.sid);
  assert(card.student_name() == "Dorothy Vaughan");
  assert(card.semester() == "Fall");
  assert(card.academic_year() == "2024-2025");
  assert(card.lines_size() == 2);
  assert(card.total_credits() == 6);
  assert(card.gpa() == 3.0);

  const auto& first = card.lines(0);
  assert(first.course_code() == "CS101");
  assert(first.course_name() == "Course CS101");
  assert(first.credit_hours() == 3);
  assert(first.marks() == 95.0);
  assert(first.letter() == LETTER_GRADE_A);
  assert(first.grade_points() == 4);
  assert(first.remark() == "excellent");
  assert(card.lines(1).letter() == LETTER_GRADE_C);
}

void TestGpaIsRoundedToTwoDecimals() {
  Fixture f;
  f.AddCourse("CS101", 4);
  f.AddCourse("CS102", 3);
  f.AddCourse("CS103", 2);

  f.grades.RecordGrade(f.caps, f.Enroll("CS101", "Fall"), 91.0, "");
  f.grades.RecordGrade(f.caps, f.Enroll("CS102", "Fall"), 85.0, "");
  f.grades.RecordGrade(f.caps, f.Enroll("CS103", "Fall"), 55.0, "");

  // (4*4 + 3*3 + 0*2) / 9 = 25 / 9 = 2.777...
  const auto card = f.reports.BuildReportCard(f.sid, "Fall", "2024-2025");
  assert(card.total_credits() == 9);
  assert(card.gpa() == 2.78);
}

void TestUngradedAndOtherTermEnrollmentsAreExcluded() {
  Fixture f;
  f.AddCourse("CS101", 3);
  f.AddCourse("CS102", 4);
  f.AddCourse("CS201", 3);

  f.grades.RecordGrade(f.caps, f.Enroll("CS101", "Fall"), 81.0, "");
  f.Enroll("CS102", "Fall");
  f.grades.RecordGrade(f.caps, f.Enroll("CS201", "Spring"), 99.0, "");

  const auto fall = f.reports.BuildReportCard(f.sid, "Fall", "2024-2025");
  assert(fall.lines_size() == 1);
  assert(fall.total_credits() == 3);
  assert(fall.gpa() == 3.0);

  const auto whole_year = f.reports.BuildReportCard(f.sid, "", "2024-2025");
  assert(whole_year.lines_size() == 2);
  assert(whole_year.total_credits() == 6);
  assert(whole_year.gpa() == 3.5);

  assert(f.reports.BuildReportCard(f.sid, "Fall", "2023-2024").lines_size() == 0);
}

void TestEmptyReportCardHasZeroGpa() {
  Fixture f;
  f.AddCourse("CS101", 3);
  f.Enroll("CS101", "Fall");

  const auto card = f.reports.BuildReportCard(f.sid, "Fall", "2024-2025");
  assert(card.lines_size() == 0);
  assert(card.total_credits() == 0);
  assert(card.gpa() == 0.0);
}

void TestDeletedStudentYieldsEmptyCard() {
  Fixture f;
  f.AddCourse("CS101", 3);
  f.grades.RecordGrade(f.caps, f.Enroll("CS101", "Fall"), 91.0, "");

  f.ledger.DeleteStudent(f.caps, f.sid);

  const auto card = f.reports.BuildReportCard(f.sid, "Fall", "2024-2025");
  assert(card.student_id() == f.sid);
  assert(card.student_name().empty());
  assert(card.lines_size() == 0);
  assert(card.total_credits() == 0);
  assert(card.gpa() == 0.0);
}

void TestAttendancePercentage() {
  Fixture f;
  f.AddCourse("CS101", 3);

  for (int day = 1; day <= 10; ++day) {
    const std::string date = std::string("2024-09-") + (day < 10 ? "0" : "") + std::to_string(day);
    AttendanceStatus  status = ATTENDANCE_STATUS_PRESENT;
    if (day == 4) status = ATTENDANCE_STATUS_ABSENT;
    if (day == 7) status = ATTENDANCE_STATUS_LATE;
    f.Mark(date, status);
  }

  const auto summary = f.reports.BuildAttendanceSummary(f.sid, "CS101", "", "");
  assert(summary.total_classes() == 10);
  assert(summary.present_count() == 8);
  assert(summary.absent_count() == 1);
  assert(summary.late_count() == 1);
  assert(summary.excused_count() == 0);
  assert(summary.percentage() == 80.0);

  const auto window = f.reports.BuildAttendanceSummary(f.sid, "CS101", "2024-09-01", "2024-09-03");
  assert(window.range().from() == "2024-09-01");
  assert(window.range().to() == "2024-09-03");
  assert(window.total_classes() == 3);
  assert(window.percentage() == 100.0);

  const auto thirds = f.reports.BuildAttendanceSummary(f.sid, "CS101", "2024-09-02", "2024-09-04");
  assert(thirds.total_classes() == 3);
  assert(thirds.present_count() == 2);
  assert(thirds.percentage() == 66.67);
}

void TestAttendanceWithNoClassesIsZero() {
  Fixture f;
  f.AddCourse("CS101", 3);

  const auto summary = f.reports.BuildAttendanceSummary(f.sid, "CS101", "2024-09-01", "2024-09-30");
  assert(summary.total_classes() == 0);
  assert(summary.percentage() == 0.0);

  bool threw = false;
  try {
    (void)f.reports.BuildAttendanceSummary(f.sid, "CS101", "2024-9-1", "");
  } catch (const registrar::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGpaIsCreditWeighted();
  TestGpaIsRoundedToTwoDecimals();
  TestUngradedAndOtherTermEnrollmentsAreExcluded();
  TestEmptyReportCardHasZeroGpa();
  TestDeletedStudentYieldsEmptyCard();
  TestAttendancePercentage();
  TestAttendanceWithNoClassesIsZero();

  std::cout << "registrar_unit_report_assembler: pass\n";
  return 0;
}
