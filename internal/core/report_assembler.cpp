#include "report_assembler.hpp"

#include "internal/core/attendance_register.hpp"
#include "internal/core/grade_ledger.hpp"

namespace registrar::core {

using namespace registrar::records::v1;

ReportAssembler::ReportAssembler(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

ReportCard ReportAssembler::BuildReportCard(const std::string& student_id, const std::string& semester, const std::string& academic_year) {
  ReportCard card;
  card.set_student_id(student_id);
  card.set_semester(semester);
  card.set_academic_year(academic_year);

  auto tx = repository_->Begin();

  if (const auto student = repository_->GetStudent(*tx, student_id)) {
    card.set_student_name(student->name);
  }

  uint64_t total_credits   = 0;
  uint64_t weighted_points = 0;

  for (const auto& enrollment : repository_->ListEnrollmentsByStudent(*tx, student_id)) {
    if (!semester.empty() && enrollment.semester != semester) continue;
    if (!academic_year.empty() && enrollment.academic_year != academic_year) continue;

    const auto grade = repository_->GetGrade(*tx, enrollment.id);
    if (!grade) continue;

    const auto course = repository_->GetCourse(*tx, enrollment.course_code);
    if (!course) continue;

    const auto points = GradePoints(grade->letter);

    auto* line = card.add_lines();
    line->set_course_code(course->code);
    line->set_course_name(course->name);
    line->set_credit_hours(course->credit_hours);
    line->set_marks(static_cast<double>(grade->marks_hundredths) / 100.0);
    line->set_letter(grade->letter);
    line->set_grade_points(points);
    line->set_remark(grade->remark);

    total_credits += course->credit_hours;
    weighted_points += static_cast<uint64_t>(points) * course->credit_hours;
  }

  tx->Commit();

  card.set_total_credits(static_cast<uint32_t>(total_credits));
  card.set_gpa(total_credits == 0 ? 0.0 : RoundToHundredths(static_cast<double>(weighted_points) / static_cast<double>(total_credits)));
  return card;
}

AttendanceSummary ReportAssembler::BuildAttendanceSummary(const std::string& student_id, const std::string& course_code,
                                                          const std::string& from_date, const std::string& to_date) {
  AttendanceRegister::ValidateRange(from_date, to_date);

  AttendanceSummary summary;
  summary.set_student_id(student_id);
  summary.set_course_code(course_code);
  summary.mutable_range()->set_from(from_date);
  summary.mutable_range()->set_to(to_date);

  auto tx      = repository_->Begin();
  auto records = repository_->ListAttendance(*tx, student_id, course_code, from_date, to_date);
  tx->Commit();

  uint64_t present = 0;
  uint64_t absent  = 0;
  uint64_t late    = 0;
  uint64_t excused = 0;
  for (const auto& record : records) {
    switch (record.status) {
      case ATTENDANCE_STATUS_PRESENT:
        ++present;
        break;
      case ATTENDANCE_STATUS_ABSENT:
        ++absent;
        break;
      case ATTENDANCE_STATUS_LATE:
        ++late;
        break;
      case ATTENDANCE_STATUS_EXCUSED:
        ++excused;
        break;
      default:
        break;
    }
  }

  const uint64_t total = records.size();
  summary.set_total_classes(total);
  summary.set_present_count(present);
  summary.set_absent_count(absent);
  summary.set_late_count(late);
  summary.set_excused_count(excused);
  summary.set_percentage(total == 0 ? 0.0 : RoundToHundredths(static_cast<double>(present) * 100.0 / static_cast<double>(total)));
  return summary;
}

} // namespace registrar::core
