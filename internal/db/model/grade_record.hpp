#pragma once

#include <cstdint>
#include <string>

#include "registrar/records/v1/types.pb.h"

namespace registrar::db::model {

/*
  One row per enrollment.

  Marks are stored as hundredths (9399 == 93.99) so the two-decimal
  precision survives both backends unchanged.
*/

struct GradeRecord {
  uint64_t enrollment_id = 0;
  int64_t  marks_hundredths = 0;

  registrar::records::v1::LetterGrade letter = registrar::records::v1::LETTER_GRADE_UNSPECIFIED;

  std::string remark;
  uint64_t    recorded_at_ms = 0;
};

} // namespace registrar::db::model
