#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/capability.hpp"
#include "internal/db/api/repository.hpp"
#include "registrar/records/v1/types.pb.h"

namespace registrar::core {

// Marks rounded half away from zero to hundredths (93.995 -> 9400).
int64_t ToHundredths(double marks);

// Two-decimal rounding used for every derived figure (GPA, percentages).
double RoundToHundredths(double value);

// A >= 90, B >= 80, C >= 70, D >= 60, else F.
registrar::records::v1::LetterGrade DeriveLetterGrade(int64_t marks_hundredths);

// A=4, B=3, C=2, D=1, F=0.
uint32_t GradePoints(registrar::records::v1::LetterGrade letter);

char LetterSymbol(registrar::records::v1::LetterGrade letter);

/*
  One grade per enrollment; recording again replaces it.
*/
class GradeLedger {
 public:
  explicit GradeLedger(std::shared_ptr<db::Repository> repository);

  registrar::records::v1::Grade RecordGrade(const CapabilitySet& caps, uint64_t enrollment_id, double marks, const std::string& remark);

  registrar::records::v1::Grade GetGrade(uint64_t enrollment_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace registrar::core
