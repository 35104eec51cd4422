#include "capability.hpp"

#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace registrar::core {

namespace {

constexpr std::array<std::pair<std::string_view, Capability>, 4> kCapabilityNames = {{
    {"enroll", Capability::kEnroll},
    {"mark_attendance", Capability::kMarkAttendance},
    {"record_grade", Capability::kRecordGrade},
    {"manage_records", Capability::kManageRecords},
}};

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
  return text;
}

} // namespace

std::string_view CapabilityName(Capability capability) {
  for (const auto& [name, value] : kCapabilityNames) {
    if (value == capability) return name;
  }
  return "unknown";
}

CapabilitySet CapabilitySet::All() {
  CapabilitySet set;
  for (const auto& [_, value] : kCapabilityNames) {
    set.Grant(value);
  }
  return set;
}

CapabilitySet CapabilitySet::Parse(std::string_view text) {
  CapabilitySet set;
  while (!text.empty()) {
    const auto comma = text.find(',');
    const auto token = Trim(text.substr(0, comma));
    for (const auto& [name, value] : kCapabilityNames) {
      if (token == name) set.Grant(value);
    }
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return set;
}

void CapabilitySet::Require(Capability capability, std::string_view action) const {
  if (Has(capability)) {
    return;
  }
  throw util::PermissionDenied(std::string(action) + " requires capability " + std::string(CapabilityName(capability)),
                               std::string(CapabilityName(capability)));
}

} // namespace registrar::core
