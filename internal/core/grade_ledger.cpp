#include "grade_ledger.hpp"

#include <cmath>

#include "internal/core/record_mapping.hpp"
#include "internal/core/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace registrar::core {

using namespace registrar::records::v1;

int64_t ToHundredths(double marks) {
  return static_cast<int64_t>(std::llround(marks * 100.0));
}

double RoundToHundredths(double value) {
  return static_cast<double>(std::llround(value * 100.0)) / 100.0;
}

LetterGrade DeriveLetterGrade(int64_t marks_hundredths) {
  if (marks_hundredths >= 9000) return LETTER_GRADE_A;
  if (marks_hundredths >= 8000) return LETTER_GRADE_B;
  if (marks_hundredths >= 7000) return LETTER_GRADE_C;
  if (marks_hundredths >= 6000) return LETTER_GRADE_D;
  return LETTER_GRADE_F;
}

uint32_t GradePoints(LetterGrade letter) {
  switch (letter) {
    case LETTER_GRADE_A:
      return 4;
    case LETTER_GRADE_B:
      return 3;
    case LETTER_GRADE_C:
      return 2;
    case LETTER_GRADE_D:
      return 1;
    default:
      return 0;
  }
}

char LetterSymbol(LetterGrade letter) {
  switch (letter) {
    case LETTER_GRADE_A:
      return 'A';
    case LETTER_GRADE_B:
      return 'B';
    case LETTER_GRADE_C:
      return 'C';
    case LETTER_GRADE_D:
      return 'D';
    case LETTER_GRADE_F:
      return 'F';
    default:
      return '?';
  }
}

GradeLedger::GradeLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

Grade GradeLedger::RecordGrade(const CapabilitySet& caps, uint64_t enrollment_id, double marks, const std::string& remark) {
  caps.Require(Capability::kRecordGrade, "record grade");

  const auto key = std::to_string(enrollment_id);
  if (std::isnan(marks) || marks < 0.0 || marks > 100.0) {
    throw util::InvalidScore("marks must be a number between 0 and 100, got " + std::to_string(marks), key);
  }

  db::model::GradeRecord record;
  record.enrollment_id    = enrollment_id;
  record.marks_hundredths = ToHundredths(marks);
  record.letter           = DeriveLetterGrade(record.marks_hundredths);
  record.remark           = remark;
  record.recorded_at_ms   = util::ToUnixMillis(util::Now());

  RunInTransaction(*repository_, kDefaultTransactionAttempts, [&](db::Transaction& tx) {
    if (!repository_->GetEnrollment(tx, enrollment_id)) {
      throw util::NotFound("enrollment not found: " + key, key);
    }
    ThrowIfDbError(repository_->UpsertGrade(tx, record), "upsert grade", key);
  });

  return ToGrade(record);
}

Grade GradeLedger::GetGrade(uint64_t enrollment_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetGrade(*tx, enrollment_id);
  tx->Commit();

  if (!record) {
    throw util::NotFound("no grade recorded for enrollment " + std::to_string(enrollment_id), std::to_string(enrollment_id));
  }
  return ToGrade(*record);
}

} // namespace registrar::core
