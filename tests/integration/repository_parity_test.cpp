#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/attendance_register.hpp"
#include "internal/core/capability.hpp"
#include "internal/core/enrollment_ledger.hpp"
#include "internal/core/grade_ledger.hpp"
#include "internal/core/identity_allocator.hpp"
#include "internal/core/records_catalog.hpp"
#include "internal/core/report_assembler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if REGISTRAR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using registrar::db::ErrorCode;
using registrar::db::Repository;
using registrar::db::memory::MemoryRepository;
using registrar::db::model::AttendanceRecord;
using registrar::db::model::CourseRecord;
using registrar::db::model::EnrollmentRecord;
using registrar::db::model::GradeRecord;
using registrar::db::model::NotificationRecord;
using registrar::db::model::StudentRecord;
using namespace registrar::records::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

bool IsDuplicate(const registrar::db::Result& result) {
  return result.code == ErrorCode::AlreadyExists || result.code == ErrorCode::ConstraintViolation;
}

StudentRecord MakeStudent(const std::string& id) {
  StudentRecord s;
  s.id              = id;
  s.name            = "Student " + id;
  s.date_of_birth   = "2004-01-31";
  s.gender          = GENDER_OTHER;
  s.email           = id + "@example.edu";
  s.photo_ref       = "photos/" + id;
  s.enrollment_date = "2024-08-26";
  return s;
}

CourseRecord MakeCourse(const std::string& code, uint32_t credits) {
  return CourseRecord{code, "Course " + code, credits, "Engineering"};
}

void VerifyCountsOnFreshStore(Repository& repo) {
  auto tx     = repo.Begin();
  auto counts = repo.CountRecords(*tx);
  tx->Commit();

  assert(counts.students == 0);
  assert(counts.courses == 0);
  assert(counts.enrollments == 0);
  assert(counts.attendance_records == 0);
  assert(counts.grades == 0);
  assert(counts.notifications == 0);
}

void VerifyStudentsAndSequences(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  assert(repo.InsertStudent(*tx, MakeStudent(prefix + "0001")));
  assert(repo.InsertStudent(*tx, MakeStudent(prefix + "0002")));
  assert(IsDuplicate(repo.InsertStudent(*tx, MakeStudent(prefix + "0001"))));

  auto fetched = repo.GetStudent(*tx, prefix + "0002");
  assert(fetched.has_value());
  assert(fetched->name == "Student " + prefix + "0002");
  assert(fetched->date_of_birth == "2004-01-31");
  assert(fetched->gender == GENDER_OTHER);
  assert(fetched->photo_ref == "photos/" + prefix + "0002");
  assert(fetched->enrollment_date == "2024-08-26");
  assert(!repo.GetStudent(*tx, prefix + "9999").has_value());

  assert(repo.ListStudentIdsWithPrefix(*tx, prefix).size() == 2);
  assert(repo.ListStudentIdsWithPrefix(*tx, prefix + "0002").size() == 1);

  assert(!repo.GetStudentSequence(*tx, 3001).has_value());
  assert(repo.SetStudentSequence(*tx, 3001, 7));
  assert(repo.SetStudentSequence(*tx, 3001, 8));
  assert(repo.GetStudentSequence(*tx, 3001) == 8u);

  assert(repo.DeleteStudent(*tx, prefix + "0001"));
  assert(repo.DeleteStudent(*tx, prefix + "0001"));
  assert(!repo.GetStudent(*tx, prefix + "0001").has_value());

  tx->Commit();
}

void VerifyEnrollmentUniqueness(Repository& repo, const std::string& sid, const std::string& code) {
  auto tx = repo.Begin();
  assert(repo.InsertStudent(*tx, MakeStudent(sid)));
  assert(repo.InsertCourse(*tx, MakeCourse(code, 3)));
  assert(IsDuplicate(repo.InsertCourse(*tx, MakeCourse(code, 4))));

  EnrollmentRecord fall{0, sid, code, "Fall", "2024-2025", NowMs()};
  EnrollmentRecord spring{0, sid, code, "Spring", "2024-2025", NowMs()};
  assert(repo.InsertEnrollment(*tx, fall));
  assert(repo.InsertEnrollment(*tx, spring));
  assert(fall.id != 0);
  assert(spring.id > fall.id);

  EnrollmentRecord again{0, sid, code, "Fall", "2024-2025", NowMs()};
  assert(IsDuplicate(repo.InsertEnrollment(*tx, again)));

  auto found = repo.FindEnrollment(*tx, sid, code, "Spring", "2024-2025");
  assert(found.has_value() && found->id == spring.id);
  assert(!repo.FindEnrollment(*tx, sid, code, "Summer", "2024-2025").has_value());

  auto by_student = repo.ListEnrollmentsByStudent(*tx, sid);
  assert(by_student.size() == 2);
  assert(by_student[0].id == fall.id);
  assert(by_student[1].id == spring.id);
  assert(repo.ListEnrollmentsByCourse(*tx, code).size() == 2);

  assert(repo.DeleteEnrollment(*tx, fall.id));
  assert(!repo.GetEnrollment(*tx, fall.id).has_value());

  // The tuple is free again once its row is gone.
  EnrollmentRecord reenroll{0, sid, code, "Fall", "2024-2025", NowMs()};
  assert(repo.InsertEnrollment(*tx, reenroll));
  tx->Commit();
}

void VerifyAttendanceUpsertAndRange(Repository& repo, const std::string& sid, const std::string& code) {
  auto tx = repo.Begin();
  assert(repo.InsertStudent(*tx, MakeStudent(sid)));
  assert(repo.InsertCourse(*tx, MakeCourse(code, 2)));

  bool inserted = false;
  for (const char* date : {"2024-09-03", "2024-09-01", "2024-09-02", "2024-10-15"}) {
    assert(repo.UpsertAttendance(*tx, AttendanceRecord{sid, code, date, ATTENDANCE_STATUS_PRESENT, ""}, inserted));
    assert(inserted);
  }
  assert(repo.UpsertAttendance(*tx, AttendanceRecord{sid, code, "2024-09-02", ATTENDANCE_STATUS_EXCUSED, "doctor"}, inserted));
  assert(!inserted);

  auto all = repo.ListAttendance(*tx, sid, code, "", "");
  assert(all.size() == 4);
  assert(all[0].date == "2024-09-01");
  assert(all[1].date == "2024-09-02");
  assert(all[1].status == ATTENDANCE_STATUS_EXCUSED);
  assert(all[1].remark == "doctor");
  assert(all[3].date == "2024-10-15");

  assert(repo.ListAttendance(*tx, sid, code, "2024-09-02", "2024-09-03").size() == 2);
  assert(repo.ListAttendance(*tx, sid, code, "2024-09-04", "").size() == 1);
  assert(repo.ListAttendance(*tx, sid, code, "", "2024-09-01").size() == 1);
  assert(repo.ListAttendance(*tx, sid, "OTHER", "", "").empty());

  assert(repo.DeleteAttendanceByStudentCourse(*tx, sid, code));
  assert(repo.ListAttendance(*tx, sid, code, "", "").empty());
  tx->Commit();
}

void VerifyGradesReplace(Repository& repo, const std::string& sid, const std::string& code) {
  auto tx = repo.Begin();
  assert(repo.InsertStudent(*tx, MakeStudent(sid)));
  assert(repo.InsertCourse(*tx, MakeCourse(code, 4)));
  EnrollmentRecord enrollment{0, sid, code, "Fall", "2024-2025", NowMs()};
  assert(repo.InsertEnrollment(*tx, enrollment));

  assert(repo.UpsertGrade(*tx, GradeRecord{enrollment.id, 8999, LETTER_GRADE_B, "close", NowMs()}));
  assert(repo.UpsertGrade(*tx, GradeRecord{enrollment.id, 9300, LETTER_GRADE_A, "regraded", NowMs()}));

  auto grade = repo.GetGrade(*tx, enrollment.id);
  assert(grade.has_value());
  assert(grade->marks_hundredths == 9300);
  assert(grade->letter == LETTER_GRADE_A);
  assert(grade->remark == "regraded");

  assert(repo.DeleteGrade(*tx, enrollment.id));
  assert(!repo.GetGrade(*tx, enrollment.id).has_value());
  tx->Commit();
}

void VerifyNotifications(Repository& repo, const std::string& user) {
  auto tx = repo.Begin();

  NotificationRecord first{0, user, "first", "general", false, NowMs()};
  NotificationRecord second{0, user, "second", "grade", false, NowMs()};
  NotificationRecord other{0, user + "-other", "other", "general", false, NowMs()};
  assert(repo.InsertNotification(*tx, first));
  assert(repo.InsertNotification(*tx, second));
  assert(repo.InsertNotification(*tx, other));
  assert(second.id > first.id);

  auto listed = repo.ListNotifications(*tx, user, false);
  assert(listed.size() == 2);
  assert(listed[0].message == "second");
  assert(listed[1].message == "first");

  uint64_t updated = 0;
  assert(repo.MarkNotificationsRead(*tx, user, updated));
  assert(updated == 2);
  assert(repo.MarkNotificationsRead(*tx, user, updated));
  assert(updated == 0);
  assert(repo.ListNotifications(*tx, user, true).empty());
  assert(repo.ListNotifications(*tx, user, false)[0].read);

  uint64_t deleted = 0;
  assert(repo.DeleteNotifications(*tx, user, deleted));
  assert(deleted == 2);
  assert(repo.ListNotifications(*tx, user + "-other", true).size() == 1);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& sid) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertStudent(*tx, MakeStudent(sid)));
    tx->Rollback();
  }
  {
    // Dropped without Commit().
    auto tx = repo.Begin();
    assert(repo.InsertCourse(*tx, MakeCourse(sid + "-course", 3)));
  }

  auto tx = repo.Begin();
  assert(!repo.GetStudent(*tx, sid).has_value());
  assert(!repo.GetCourse(*tx, sid + "-course").has_value());
  tx->Commit();
}

// Runs the engine itself on top of the backend.
void VerifyEngineFlow(const std::shared_ptr<Repository>& repo) {
  const auto caps      = registrar::core::CapabilitySet::All();
  auto       allocator = std::make_shared<registrar::core::IdentityAllocator>(repo, 5);
  registrar::core::RecordsCatalog     catalog(repo, allocator);
  registrar::core::EnrollmentLedger   ledger(repo);
  registrar::core::AttendanceRegister attendance(repo);
  registrar::core::GradeLedger        grades(repo);
  registrar::core::ReportAssembler    reports(repo);

  StudentProfile profile;
  profile.set_name("Engine Student");
  profile.set_gender(GENDER_FEMALE);
  const auto sid = catalog.CreateStudent(caps, profile, 2031).id();
  assert(sid == "STU20310001");

  Course course;
  course.set_code("ENG101");
  course.set_name("Engine Course");
  course.set_credit_hours(3);
  catalog.CreateCourse(caps, course);
  course.set_code("ENG102");
  catalog.CreateCourse(caps, course);

  const auto first  = ledger.Enroll(caps, sid, "ENG101", "Fall", "2031-2032").id();
  const auto second = ledger.Enroll(caps, sid, "ENG102", "Fall", "2031-2032").id();

  bool duplicate = false;
  try {
    ledger.Enroll(caps, sid, "ENG101", "Fall", "2031-2032");
  } catch (const registrar::util::DuplicateEnrollment&) {
    duplicate = true;
  }
  assert(duplicate);

  assert(grades.RecordGrade(caps, first, 93.0, "").letter() == LETTER_GRADE_A);
  assert(grades.RecordGrade(caps, second, 70.0, "").letter() == LETTER_GRADE_C);

  const auto card = reports.BuildReportCard(sid, "Fall", "2031-2032");
  assert(card.lines_size() == 2);
  assert(card.gpa() == 3.0);

  for (const char* date : {"2031-09-01", "2031-09-02", "2031-09-03", "2031-09-04"}) {
    attendance.MarkAttendance(caps, "ENG101", date, {registrar::core::AttendanceEntry{sid, ATTENDANCE_STATUS_PRESENT, ""}});
  }
  auto updated = attendance.MarkAttendance(caps, "ENG101", "2031-09-04", {registrar::core::AttendanceEntry{sid, ATTENDANCE_STATUS_ABSENT, ""}});
  assert(!updated[0].inserted);
  assert(reports.BuildAttendanceSummary(sid, "ENG101", "", "").percentage() == 75.0);

  ledger.DeleteStudent(caps, sid);
  assert(reports.BuildReportCard(sid, "Fall", "2031-2032").lines_size() == 0);
  assert(reports.BuildAttendanceSummary(sid, "ENG101", "", "").total_classes() == 0);
  assert(catalog.CreateStudent(caps, profile, 2031).id() == "STU20310002");
}

void VerifyConcurrentEnginePaths(const std::shared_ptr<Repository>& repo) {
  const auto caps      = registrar::core::CapabilitySet::All();
  auto       allocator = std::make_shared<registrar::core::IdentityAllocator>(repo, 5);
  registrar::core::RecordsCatalog catalog(repo, allocator);

  constexpr int            kThreads = 4;
  std::vector<std::string> ids(kThreads * 5);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      StudentProfile profile;
      profile.set_name("Concurrent");
      profile.set_gender(GENDER_MALE);
      for (int i = 0; i < 5; ++i) {
        ids[t * 5 + i] = catalog.CreateStudent(caps, profile, 2032).id();
      }
    });
  }
  for (auto& thread : threads) thread.join();

  std::sort(ids.begin(), ids.end());
  assert(std::unique(ids.begin(), ids.end()) == ids.end());
  assert(ids.front() == "STU20320001");
  assert(ids.back() == "STU20320020");
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertStudent(*tx, MakeStudent("STU40000001")));
    assert(repo->InsertCourse(*tx, MakeCourse("DUR101", 5)));
    assert(repo->SetStudentSequence(*tx, 4000, 1));
    EnrollmentRecord enrollment{0, "STU40000001", "DUR101", "Fall", "2040-2041", NowMs()};
    assert(repo->InsertEnrollment(*tx, enrollment));
    assert(repo->UpsertGrade(*tx, GradeRecord{enrollment.id, 7725, LETTER_GRADE_C, "durable", NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetStudent(*tx, "STU40000001").has_value());
  assert(repo->GetCourse(*tx, "DUR101")->credit_hours == 5);
  assert(repo->GetStudentSequence(*tx, 4000) == 1u);
  auto enrollments = repo->ListEnrollmentsByStudent(*tx, "STU40000001");
  assert(enrollments.size() == 1);
  auto grade = repo->GetGrade(*tx, enrollments[0].id);
  assert(grade.has_value() && grade->marks_hundredths == 7725 && grade->remark == "durable");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if REGISTRAR_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("registrar_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db   = std::make_shared<registrar::db::sqlite::SqliteDB>(db_path);
    auto repo = std::make_shared<registrar::db::sqlite::SqliteRepository>(std::move(db));
    repo->BootstrapSchema();
    return repo;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyCountsOnFreshStore(*repo);
    VerifyStudentsAndSequences(*repo, "STU3001");
    VerifyEnrollmentUniqueness(*repo, "STU30020001", "ENR101");
    VerifyAttendanceUpsertAndRange(*repo, "STU30030001", "ATT101");
    VerifyGradesReplace(*repo, "STU30040001", "GRD101");
    VerifyNotifications(*repo, "STU30050001");
    VerifyRollbackBehavior(*repo, "STU30060001");
    VerifyEngineFlow(repo);
    VerifyConcurrentEnginePaths(repo);

    VerifyRestartDurability(backend);
  }

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if REGISTRAR_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "registrar_integration_repository_parity: pass\n";
  return 0;
}
