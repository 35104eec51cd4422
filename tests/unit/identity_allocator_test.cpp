#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/capability.hpp"
#include "internal/core/enrollment_ledger.hpp"
#include "internal/core/identity_allocator.hpp"
#include "internal/core/records_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using registrar::core::CapabilitySet;
using registrar::core::IdentityAllocator;
using registrar::db::memory::MemoryRepository;

registrar::records::v1::StudentProfile Profile(const std::string& name) {
  registrar::records::v1::StudentProfile profile;
  profile.set_name(name);
  profile.set_gender(registrar::records::v1::GENDER_FEMALE);
  profile.set_date_of_birth("2005-03-14");
  return profile;
}

void TestSequentialIdsArePaddedAndIncreasing() {
  auto              repo = std::make_shared<MemoryRepository>();
  IdentityAllocator allocator(repo, 5);

  assert(allocator.Allocate(2024) == "STU20240001");
  assert(allocator.Allocate(2024) == "STU20240002");
  assert(allocator.Allocate(2025) == "STU20250001");
  assert(allocator.Allocate(2024) == "STU20240003");
}

void TestFormattingWidensPastFourDigits() {
  assert(IdentityAllocator::FormatStudentId(2024, 7) == "STU20240007");
  assert(IdentityAllocator::FormatStudentId(2024, 9999) == "STU20249999");
  assert(IdentityAllocator::FormatStudentId(2024, 10000) == "STU202410000");

  assert(IdentityAllocator::ParseSequence("STU202410000", 2024) == 10000u);
  assert(IdentityAllocator::ParseSequence("STU20240042", 2024) == 42u);
  assert(!IdentityAllocator::ParseSequence("STU20250042", 2024));
  assert(!IdentityAllocator::ParseSequence("STU2024", 2024));
  assert(!IdentityAllocator::ParseSequence("STU2024abc", 2024));
}

void TestAllocationContinuesAfterNineNineNineNine() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto tx = repo->Begin();
    auto r  = repo->SetStudentSequence(*tx, 2024, 9999);
    assert(r);
    tx->Commit();
  }

  IdentityAllocator allocator(repo, 5);
  assert(allocator.Allocate(2024) == "STU202410000");
  assert(allocator.Allocate(2024) == "STU202410001");
}

void TestInvalidYearIsRejected() {
  auto              repo = std::make_shared<MemoryRepository>();
  IdentityAllocator allocator(repo, 5);

  for (int year : {0, 999, 10000, -2024}) {
    bool threw = false;
    try {
      (void)allocator.Allocate(year);
    } catch (const registrar::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestConcurrentAllocationsAreDistinct() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto allocator = std::make_shared<IdentityAllocator>(repo, 5);

  constexpr int kThreads   = 8;
  constexpr int kPerThread = 25;

  std::vector<std::vector<std::string>> ids(kThreads);
  std::vector<std::thread>              threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        ids[t].push_back(allocator->Allocate(2024));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  std::set<std::string> unique;
  for (const auto& batch : ids) unique.insert(batch.begin(), batch.end());
  assert(unique.size() == static_cast<size_t>(kThreads * kPerThread));
  assert(unique.count("STU20240001") == 1);
  assert(unique.count("STU20240200") == 1);
}

void TestConcurrentStudentCreationYieldsDistinctIds() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto allocator = std::make_shared<IdentityAllocator>(repo, 5);
  auto catalog   = std::make_shared<registrar::core::RecordsCatalog>(repo, allocator);
  const auto caps = CapabilitySet::All();

  constexpr int kThreads = 6;
  std::vector<std::string> ids(kThreads * 10);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10; ++i) {
        ids[t * 10 + i] = catalog->CreateStudent(caps, Profile("student"), 2024).id();
      }
    });
  }
  for (auto& thread : threads) thread.join();

  std::set<std::string> unique(ids.begin(), ids.end());
  assert(unique.size() == ids.size());
  assert(catalog->ListStudents().size() == ids.size());
}

void TestUnrelatedWritersNeverCauseAllocationConflicts() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto allocator = std::make_shared<IdentityAllocator>(repo, 0);
  auto catalog   = std::make_shared<registrar::core::RecordsCatalog>(repo, allocator);
  const auto caps = CapabilitySet::All();

  constexpr int kWriters   = 4;
  constexpr int kPerWriter = 100;

  std::vector<std::thread> writers;
  for (int t = 0; t < kWriters; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < kPerWriter; ++i) {
        registrar::records::v1::Course course;
        course.set_code("C" + std::to_string(t) + "-" + std::to_string(i));
        course.set_name("Course");
        course.set_credit_hours(3);
        catalog->CreateCourse(caps, course);
      }
    });
  }

  // No retries: a commit on another key must never fail an allocation.
  std::vector<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    ids.push_back(allocator->Allocate(2030));
  }
  for (auto& writer : writers) writer.join();

  assert(ids.front() == "STU20300001");
  assert(ids.back() == "STU20300100");
  assert(catalog->ListCourses().size() == static_cast<size_t>(kWriters * kPerWriter));
}

void TestDeletedIdsAreNeverReissued() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto allocator = std::make_shared<IdentityAllocator>(repo, 5);
  auto catalog   = std::make_shared<registrar::core::RecordsCatalog>(repo, allocator);
  registrar::core::EnrollmentLedger ledger(repo);
  const auto caps = CapabilitySet::All();

  const auto first  = catalog->CreateStudent(caps, Profile("Ada"), 2024).id();
  const auto second = catalog->CreateStudent(caps, Profile("Grace"), 2024).id();
  assert(first == "STU20240001");
  assert(second == "STU20240002");

  ledger.DeleteStudent(caps, second);
  const auto third = catalog->CreateStudent(caps, Profile("Edsger"), 2024).id();
  assert(third == "STU20240003");
}

void TestExistingIdsAboveHighWaterMarkAreRespected() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    // A store that predates the high-water mark only has the student rows.
    auto                                tx = repo->Begin();
    registrar::db::model::StudentRecord record;
    record.id     = "STU20240041";
    record.name   = "Imported";
    record.gender = registrar::records::v1::GENDER_OTHER;
    auto r        = repo->InsertStudent(*tx, record);
    assert(r);
    tx->Commit();
  }

  IdentityAllocator allocator(repo, 5);
  assert(allocator.Allocate(2024) == "STU20240042");
}

} // namespace

int main() {
  TestSequentialIdsArePaddedAndIncreasing();
  TestFormattingWidensPastFourDigits();
  TestAllocationContinuesAfterNineNineNineNine();
  TestInvalidYearIsRejected();
  TestConcurrentAllocationsAreDistinct();
  TestConcurrentStudentCreationYieldsDistinctIds();
  TestUnrelatedWritersNeverCauseAllocationConflicts();
  TestDeletedIdsAreNeverReissued();
  TestExistingIdsAboveHighWaterMarkAreRespected();

  std::cout << "registrar_unit_identity_allocator: pass\n";
  return 0;
}
