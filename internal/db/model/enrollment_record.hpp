#pragma once

#include <cstdint>
#include <string>

namespace registrar::db::model {

/*
  (student_id, course_code, semester, academic_year) is unique.
  id is assigned by the store on insert.
*/

struct EnrollmentRecord {
  uint64_t    id = 0;
  std::string student_id;
  std::string course_code;
  std::string semester;
  std::string academic_year;
  uint64_t    created_at_ms = 0;
};

} // namespace registrar::db::model
