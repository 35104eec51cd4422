#include "records_catalog.hpp"

#include "internal/core/identity_allocator.hpp"
#include "internal/core/record_mapping.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace registrar::core {

using namespace registrar::records::v1;

namespace {

void ValidateProfile(const StudentProfile& profile) {
  if (profile.name().empty()) {
    throw util::ValidationError("student name is required");
  }
  switch (profile.gender()) {
    case GENDER_MALE:
    case GENDER_FEMALE:
    case GENDER_OTHER:
      break;
    default:
      throw util::ValidationError("student gender must be male, female or other");
  }
  if (!profile.date_of_birth().empty() && !util::IsIsoDate(profile.date_of_birth())) {
    throw util::ValidationError("date of birth must be YYYY-MM-DD", profile.date_of_birth());
  }
}

void ValidateCourse(const Course& course) {
  if (course.code().empty()) {
    throw util::ValidationError("course code is required");
  }
  if (course.name().empty()) {
    throw util::ValidationError("course name is required", course.code());
  }
  if (course.credit_hours() < kMinCreditHours || course.credit_hours() > kMaxCreditHours) {
    throw util::ValidationError("course credit hours must be between " + std::to_string(kMinCreditHours) + " and " +
                                    std::to_string(kMaxCreditHours) + ", got " + std::to_string(course.credit_hours()),
                                course.code());
  }
}

} // namespace

RecordsCatalog::RecordsCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<IdentityAllocator> allocator)
    : repository_(std::move(repository)), allocator_(std::move(allocator)) {
}

Student RecordsCatalog::CreateStudent(const CapabilitySet& caps, const StudentProfile& profile, int year) {
  caps.Require(Capability::kManageRecords, "create student");
  ValidateProfile(profile);
  IdentityAllocator::ValidateYear(year);

  const auto enrollment_date = util::Today();

  auto lock = allocator_->LockYear(year);
  try {
    return RunInTransaction(*repository_, allocator_->max_attempts(), [&](db::Transaction& tx) {
      const auto id     = allocator_->AllocateWithin(tx, year);
      const auto record = ToStudentRecord(id, profile, enrollment_date);
      ThrowIfDbError(repository_->InsertStudent(tx, record), "insert student", id);
      return ToStudent(record);
    });
  } catch (const db::TransactionConflict& e) {
    throw util::AllocationConflict("student id allocation for " + std::to_string(year) + " kept conflicting: " + e.what(),
                                   std::to_string(year));
  }
}

Student RecordsCatalog::GetStudent(const std::string& student_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetStudent(*tx, student_id);
  tx->Commit();

  if (!record) {
    throw util::NotFound("student not found: " + student_id, student_id);
  }
  return ToStudent(*record);
}

std::vector<Student> RecordsCatalog::ListStudents() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListStudents(*tx);
  tx->Commit();

  std::vector<Student> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToStudent(record));
  }
  return out;
}

Course RecordsCatalog::CreateCourse(const CapabilitySet& caps, const Course& course) {
  caps.Require(Capability::kManageRecords, "create course");
  ValidateCourse(course);

  const auto record = ToCourseRecord(course);
  RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->InsertCourse(tx, record), "insert course", record.code);
  });
  return ToCourse(record);
}

Course RecordsCatalog::GetCourse(const std::string& course_code) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCourse(*tx, course_code);
  tx->Commit();

  if (!record) {
    throw util::NotFound("course not found: " + course_code, course_code);
  }
  return ToCourse(*record);
}

std::vector<Course> RecordsCatalog::ListCourses() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListCourses(*tx);
  tx->Commit();

  std::vector<Course> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToCourse(record));
  }
  return out;
}

} // namespace registrar::core
