#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace registrar::core {

/*
  Privileges resolved by the upstream authorization layer.

  The engine never authenticates anyone; it only checks that the caller
  was granted the capability an operation needs.
*/
enum class Capability : uint8_t {
  kEnroll         = 1 << 0,
  kMarkAttendance = 1 << 1,
  kRecordGrade    = 1 << 2,
  kManageRecords  = 1 << 3,
};

std::string_view CapabilityName(Capability capability);

class CapabilitySet {
 public:
  CapabilitySet() = default;

  static CapabilitySet All();

  // Comma separated names ("enroll, record_grade"). Unknown names are ignored.
  static CapabilitySet Parse(std::string_view text);

  CapabilitySet& Grant(Capability capability) {
    bits_ |= static_cast<uint8_t>(capability);
    return *this;
  }

  CapabilitySet& Merge(const CapabilitySet& other) {
    bits_ |= other.bits_;
    return *this;
  }

  bool Has(Capability capability) const {
    return (bits_ & static_cast<uint8_t>(capability)) != 0;
  }

  bool Empty() const {
    return bits_ == 0;
  }

  // Throws util::PermissionDenied naming the action when capability is missing.
  void Require(Capability capability, std::string_view action) const;

 private:
  uint8_t bits_ = 0;
};

} // namespace registrar::core
