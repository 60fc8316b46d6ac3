#include "wgsessions/types.hpp"

#include "wgsessions/timestamp.hpp"

namespace wgsessions {

const char* const kUnknownPeer = "Unknown";
const char* const kAllPeers = "all";

bool operator==(const Date& a, const Date& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) { return !(a == b); }

bool operator<(const Date& a, const Date& b) {
  if (a.year != b.year) return a.year < b.year;
  if (a.month != b.month) return a.month < b.month;
  return a.day < b.day;
}

bool operator<=(const Date& a, const Date& b) { return !(b < a); }

std::int64_t Timestamp::epoch_seconds() const {
  const std::int64_t local = days_from_civil(date) * 86400 +
                             static_cast<std::int64_t>(hour) * 3600 +
                             static_cast<std::int64_t>(minute) * 60 + second;
  return local - static_cast<std::int64_t>(offset_minutes) * 60;
}

std::int64_t Session::duration_seconds() const {
  const std::int64_t d = end.epoch_seconds() - start.epoch_seconds();
  return d < 0 ? 0 : d;
}

} // namespace wgsessions
