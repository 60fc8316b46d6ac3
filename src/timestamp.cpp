#include "wgsessions/timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace wgsessions {

static bool is_leap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && is_leap(year)) return 29;
  return kDays[month - 1];
}

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t days_from_civil(const Date& d) {
  const std::int64_t y = static_cast<std::int64_t>(d.year) - (d.month <= 2 ? 1 : 0);
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const std::int64_t yoe = y - era * 400;
  const std::int64_t mp = (d.month + 9) % 12;
  const std::int64_t doy = (153 * mp + 2) / 5 + d.day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

Date civil_from_days(std::int64_t days) {
  const std::int64_t z = days + 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;

  Date out;
  out.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  out.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  out.year = static_cast<int>(yoe + era * 400 + (out.month <= 2 ? 1 : 0));
  return out;
}

Date add_days(const Date& d, std::int64_t n) {
  return civil_from_days(days_from_civil(d) + n);
}

Date local_today() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);

  Date d;
  d.year = tm.tm_year + 1900;
  d.month = tm.tm_mon + 1;
  d.day = tm.tm_mday;
  return d;
}

// Reads `width` ASCII digits starting at pos.
static bool read_digits(const std::string& s, size_t pos, size_t width, int& out) {
  if (pos + width > s.size()) return false;
  int v = 0;
  for (size_t i = pos; i < pos + width; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}

static bool valid_date(const Date& d) {
  if (d.year < 1) return false;
  if (d.month < 1 || d.month > 12) return false;
  return d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

TimestampParse parse_timestamp(const std::string& s, Timestamp& out) {
  // 0123456789012345678901234
  // YYYY-MM-DDTHH:MM:SS+HH:MM
  if (s.size() != 25) return TimestampParse::kBadShape;
  if (s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':' ||
      s[22] != ':')
    return TimestampParse::kBadShape;
  if (s[19] != '+' && s[19] != '-') return TimestampParse::kBadShape;

  Timestamp ts;
  int off_h = 0;
  int off_m = 0;
  if (!read_digits(s, 0, 4, ts.date.year) || !read_digits(s, 5, 2, ts.date.month) ||
      !read_digits(s, 8, 2, ts.date.day) || !read_digits(s, 11, 2, ts.hour) ||
      !read_digits(s, 14, 2, ts.minute) || !read_digits(s, 17, 2, ts.second) ||
      !read_digits(s, 20, 2, off_h) || !read_digits(s, 23, 2, off_m))
    return TimestampParse::kBadShape;

  if (!valid_date(ts.date)) return TimestampParse::kBadValue;
  if (ts.hour > 23 || ts.minute > 59 || ts.second > 59) return TimestampParse::kBadValue;
  if (off_h > 23 || off_m > 59) return TimestampParse::kBadValue;

  ts.offset_minutes = off_h * 60 + off_m;
  if (s[19] == '-') ts.offset_minutes = -ts.offset_minutes;

  out = ts;
  return TimestampParse::kOk;
}

std::string format_timestamp(const Timestamp& ts) {
  const int off = ts.offset_minutes < 0 ? -ts.offset_minutes : ts.offset_minutes;
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d%c%02d:%02d",
                ts.date.year, ts.date.month, ts.date.day, ts.hour, ts.minute, ts.second,
                ts.offset_minutes < 0 ? '-' : '+', off / 60, off % 60);
  return buf;
}

bool parse_date(const std::string& s, Date& out) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;

  Date d;
  if (!read_digits(s, 0, 4, d.year) || !read_digits(s, 5, 2, d.month) ||
      !read_digits(s, 8, 2, d.day))
    return false;
  if (!valid_date(d)) return false;

  out = d;
  return true;
}

std::string format_date(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return buf;
}

} // namespace wgsessions
