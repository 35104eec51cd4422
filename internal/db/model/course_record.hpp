#pragma once

#include <cstdint>
#include <string>

namespace registrar::db::model {

struct CourseRecord {
  std::string code;
  std::string name;
  uint32_t    credit_hours = 0;
  std::string department;
};

} // namespace registrar::db::model
