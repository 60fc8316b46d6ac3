#pragma once

#include <cstdint>
#include <string>

#include "wgsessions/types.hpp"

namespace wgsessions {

enum class TimestampParse {
  kOk,
  kBadShape,  // not YYYY-MM-DDTHH:MM:SS+HH:MM at all
  kBadValue   // right shape, impossible field values
};

// Parses exactly 25 characters: YYYY-MM-DDTHH:MM:SS followed by a
// colon-bearing offset (+08:00, -05:30).
TimestampParse parse_timestamp(const std::string& s, Timestamp& out);

// 2024-05-01T10:00:00+08:00
std::string format_timestamp(const Timestamp& ts);

// YYYY-MM-DD with range checks.
bool parse_date(const std::string& s, Date& out);
std::string format_date(const Date& d);

// Civil date <-> days since 1970-01-01 (proleptic Gregorian).
std::int64_t days_from_civil(const Date& d);
Date civil_from_days(std::int64_t days);

Date add_days(const Date& d, std::int64_t n);
int days_in_month(int year, int month);

// Current calendar date in the local time zone.
Date local_today();

} // namespace wgsessions
