#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace registrar::util {

/*
  Time utilities. All clock reads go through here.

  Calendar dates (attendance days, birth and enrollment dates) are carried
  as ISO-8601 "YYYY-MM-DD" strings; the zero padding makes lexical order
  equal to chronological order, which the stores rely on for range scans.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

std::optional<std::chrono::year_month_day> ParseIsoDate(std::string_view text);
std::string                                FormatIsoDate(const std::chrono::year_month_day& date);

// True when text is a valid, canonical "YYYY-MM-DD" calendar date.
bool IsIsoDate(std::string_view text);

std::string Today();
int         CurrentYear();

} // namespace registrar::util
