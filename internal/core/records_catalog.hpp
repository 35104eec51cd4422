#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/capability.hpp"
#include "internal/db/api/repository.hpp"
#include "registrar/records/v1/types.pb.h"

namespace registrar::core {

class IdentityAllocator;

inline constexpr uint32_t kMinCreditHours = 1;
inline constexpr uint32_t kMaxCreditHours = 100;

/*
  Students and courses.

  Creation is privileged (manage_records); lookups are not. Courses are
  immutable once created.
*/
class RecordsCatalog {
 public:
  RecordsCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<IdentityAllocator> allocator);

  registrar::records::v1::Student CreateStudent(const CapabilitySet& caps, const registrar::records::v1::StudentProfile& profile, int year);
  registrar::records::v1::Student GetStudent(const std::string& student_id);
  std::vector<registrar::records::v1::Student> ListStudents();

  registrar::records::v1::Course CreateCourse(const CapabilitySet& caps, const registrar::records::v1::Course& course);
  registrar::records::v1::Course GetCourse(const std::string& course_code);
  std::vector<registrar::records::v1::Course> ListCourses();

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<IdentityAllocator> allocator_;
};

} // namespace registrar::core
