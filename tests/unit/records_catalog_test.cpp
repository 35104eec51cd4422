#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/core/capability.hpp"
#include "internal/core/identity_allocator.hpp"
#include "internal/core/records_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using registrar::core::Capability;
using registrar::core::CapabilitySet;
using registrar::core::IdentityAllocator;
using registrar::core::RecordsCatalog;
using registrar::db::memory::MemoryRepository;
using registrar::records::v1::Course;
using registrar::records::v1::StudentProfile;

struct Fixture {
  std::shared_ptr<MemoryRepository>  repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<IdentityAllocator> allocator = std::make_shared<IdentityAllocator>(repo, 5);
  RecordsCatalog                     catalog{repo, allocator};
};

StudentProfile Profile() {
  StudentProfile profile;
  profile.set_name("Ada Lovelace");
  profile.set_date_of_birth("2005-12-10");
  profile.set_gender(registrar::records::v1::GENDER_FEMALE);
  profile.set_email("ada@example.edu");
  profile.set_phone("+44 20 0000 0000");
  profile.set_address("12 St James's Square");
  profile.set_photo_ref("photos/ada.png");
  return profile;
}

Course MakeCourse(const std::string& code, uint32_t credits) {
  Course course;
  course.set_code(code);
  course.set_name("Course " + code);
  course.set_credit_hours(credits);
  course.set_department("Mathematics");
  return course;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateStudentStoresProfile() {
  Fixture f;

  const auto created = f.catalog.CreateStudent(CapabilitySet::All(), Profile(), 2024);
  assert(created.id() == "STU20240001");
  assert(created.enrollment_date() == registrar::util::Today());

  const auto fetched = f.catalog.GetStudent(created.id());
  assert(fetched.profile().name() == "Ada Lovelace");
  assert(fetched.profile().date_of_birth() == "2005-12-10");
  assert(fetched.profile().gender() == registrar::records::v1::GENDER_FEMALE);
  assert(fetched.profile().email() == "ada@example.edu");
  assert(fetched.profile().photo_ref() == "photos/ada.png");
  assert(fetched.enrollment_date() == created.enrollment_date());
}

void TestCreateStudentValidatesInput() {
  Fixture    f;
  const auto caps = CapabilitySet::All();

  auto nameless = Profile();
  nameless.clear_name();
  assert(Throws<registrar::util::ValidationError>([&] { f.catalog.CreateStudent(caps, nameless, 2024); }));

  auto no_gender = Profile();
  no_gender.set_gender(registrar::records::v1::GENDER_UNSPECIFIED);
  assert(Throws<registrar::util::ValidationError>([&] { f.catalog.CreateStudent(caps, no_gender, 2024); }));

  auto bad_dob = Profile();
  bad_dob.set_date_of_birth("2005-02-30");
  assert(Throws<registrar::util::ValidationError>([&] { f.catalog.CreateStudent(caps, bad_dob, 2024); }));

  assert(Throws<registrar::util::ValidationError>([&] { f.catalog.CreateStudent(caps, Profile(), 99); }));

  // Rejected requests must not burn identifiers.
  assert(f.catalog.CreateStudent(caps, Profile(), 2024).id() == "STU20240001");
}

void TestCreateRequiresManageRecords() {
  Fixture f;

  CapabilitySet caps;
  caps.Grant(Capability::kEnroll).Grant(Capability::kRecordGrade);

  assert(Throws<registrar::util::PermissionDenied>([&] { f.catalog.CreateStudent(caps, Profile(), 2024); }));
  assert(Throws<registrar::util::PermissionDenied>([&] { f.catalog.CreateCourse(caps, MakeCourse("MATH101", 3)); }));
  assert(f.catalog.ListStudents().empty());
  assert(f.catalog.ListCourses().empty());
}

void TestMissingStudentIsNotFound() {
  Fixture f;

  bool threw = false;
  try {
    (void)f.catalog.GetStudent("STU20249999");
  } catch (const registrar::util::NotFound& e) {
    threw = true;
    assert(e.key() == "STU20249999");
  }
  assert(threw);
}

void TestCoursesAreUniqueAndValidated() {
  Fixture    f;
  const auto caps = CapabilitySet::All();

  const auto created = f.catalog.CreateCourse(caps, MakeCourse("MATH101", 3));
  assert(created.credit_hours() == 3);
  assert(f.catalog.GetCourse("MATH101").department() == "Mathematics");

  assert(Throws<registrar::util::AlreadyExists>([&] { f.catalog.CreateCourse(caps, MakeCourse("MATH101", 4)); }));
  assert(f.catalog.GetCourse("MATH101").credit_hours() == 3);

  assert(Throws<registrar::util::ValidationError>([&] { f.catalog.CreateCourse(caps, MakeCourse("", 3)); }));
  assert(Throws<registrar::util::ValidationError>([&] { f.catalog.CreateCourse(caps, MakeCourse("PHYS101", 0)); }));

  auto unnamed = MakeCourse("CHEM101", 2);
  unnamed.clear_name();
  assert(Throws<registrar::util::ValidationError>([&] { f.catalog.CreateCourse(caps, unnamed); }));

  assert(Throws<registrar::util::NotFound>([&] { f.catalog.GetCourse("PHYS101"); }));
  assert(f.catalog.ListCourses().size() == 1);
}

void TestCreditHoursOutOfRangeAreRejected() {
  Fixture    f;
  const auto caps = CapabilitySet::All();

  // 4294967293 is what "-3" becomes after an unsigned wrap.
  for (const uint32_t credits : {uint32_t{101}, uint32_t{4294967293u}, std::numeric_limits<uint32_t>::max()}) {
    bool rejected = false;
    try {
      f.catalog.CreateCourse(caps, MakeCourse("BAD101", credits));
    } catch (const registrar::util::ValidationError& e) {
      rejected = true;
      assert(e.key() == "BAD101");
    }
    assert(rejected);
  }
  assert(f.catalog.ListCourses().empty());

  assert(f.catalog.CreateCourse(caps, MakeCourse("MIN101", registrar::core::kMinCreditHours)).credit_hours() == 1);
  assert(f.catalog.CreateCourse(caps, MakeCourse("MAX101", registrar::core::kMaxCreditHours)).credit_hours() == 100);
}

void TestListsAreOrderedByKey() {
  Fixture    f;
  const auto caps = CapabilitySet::All();

  f.catalog.CreateCourse(caps, MakeCourse("PHYS201", 4));
  f.catalog.CreateCourse(caps, MakeCourse("CS101", 3));
  f.catalog.CreateStudent(caps, Profile(), 2025);
  f.catalog.CreateStudent(caps, Profile(), 2024);

  const auto courses = f.catalog.ListCourses();
  assert(courses.size() == 2);
  assert(courses[0].code() == "CS101");
  assert(courses[1].code() == "PHYS201");

  const auto students = f.catalog.ListStudents();
  assert(students.size() == 2);
  assert(students[0].id() == "STU20240001");
  assert(students[1].id() == "STU20250001");
}

} // namespace

int main() {
  TestCreateStudentStoresProfile();
  TestCreateStudentValidatesInput();
  TestCreateRequiresManageRecords();
  TestMissingStudentIsNotFound();
  TestCoursesAreUniqueAndValidated();
  TestCreditHoursOutOfRangeAreRejected();
  TestListsAreOrderedByKey();

  std::cout << "registrar_unit_records_catalog: pass\n";
  return 0;
}
