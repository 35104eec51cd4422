#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "registrar/records/v1/report.pb.h"

namespace registrar::core {

/*
  Read-only aggregates over enrollments, grades and attendance.

  Both reports are computed from a single transaction so a concurrent
  writer never shows up half-applied.
*/
class ReportAssembler {
 public:
  explicit ReportAssembler(std::shared_ptr<db::Repository> repository);

  // One line per graded enrollment matching semester / academic_year (empty
  // matches all). GPA = sum(points * credits) / total credits, 2 decimals,
  // 0 with no credits. An unknown student yields an empty card.
  registrar::records::v1::ReportCard BuildReportCard(const std::string& student_id, const std::string& semester,
                                                     const std::string& academic_year);

  // percentage = present / total * 100, 2 decimals, 0 with no classes.
  registrar::records::v1::AttendanceSummary BuildAttendanceSummary(const std::string& student_id, const std::string& course_code,
                                                                   const std::string& from_date, const std::string& to_date);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace registrar::core
