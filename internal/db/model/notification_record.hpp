#pragma once

#include <cstdint>
#include <string>

namespace registrar::db::model {

struct NotificationRecord {
  uint64_t    id = 0;
  std::string user_id;
  std::string message;
  std::string type;
  bool        read          = false;
  uint64_t    created_at_ms = 0;
};

} // namespace registrar::db::model
