#pragma once

#include <string>

#include "registrar/records/v1/types.pb.h"

namespace registrar::db::model {

/*
  Persistent student row.

  id is allocated once (STU<year><seq>) and never reused.
  photo_ref is an opaque handle from the file storage layer.
*/

struct StudentRecord {
  std::string id;
  std::string name;
  std::string date_of_birth;

  registrar::records::v1::Gender gender = registrar::records::v1::GENDER_UNSPECIFIED;

  std::string email;
  std::string phone;
  std::string address;
  std::string photo_ref;

  // Set at creation, never updated.
  std::string enrollment_date;
};

} // namespace registrar::db::model
