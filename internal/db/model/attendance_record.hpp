#pragma once

#include <string>

#include "registrar/records/v1/types.pb.h"

namespace registrar::db::model {

/*
  Keyed on (student_id, course_code, date); date is "YYYY-MM-DD".
*/

struct AttendanceRecord {
  std::string student_id;
  std::string course_code;
  std::string date;

  registrar::records::v1::AttendanceStatus status = registrar::records::v1::ATTENDANCE_STATUS_UNSPECIFIED;

  std::string remark;
};

} // namespace registrar::db::model
