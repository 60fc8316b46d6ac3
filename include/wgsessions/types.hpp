#pragma once

#include <cstdint>
#include <string>

namespace wgsessions {

// Name recorded when the logger could not resolve a peer.
extern const char* const kUnknownPeer;
// Peer selector that disables the peer filter.
extern const char* const kAllPeers;

// Calendar date, no time zone attached.
struct Date {
  int year = 1970;
  int month = 1;
  int day = 1;
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);

// Zoned instant. Local wall-clock fields are kept as written in the log so
// the calendar date and the offset survive formatting unchanged.
struct Timestamp {
  Date date;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int offset_minutes = 0;  // east of UTC

  // Seconds since the Unix epoch (UTC); used for ordering.
  std::int64_t epoch_seconds() const;
};

enum class EventClass {
  kConnect,     // CONNECT, RECONNECT/UPDATE
  kDisconnect,  // DISCONNECT and every DISCONNECT* subtype
  kOther        // UPDATE (IP Change) and anything else
};

// One parsed log line.
struct LogEvent {
  Timestamp timestamp;
  std::string event;      // primary classifier, e.g. "DISCONNECT"
  std::string qualifier;  // text inside "(...)", may be empty
  EventClass klass = EventClass::kOther;
  std::string peer_key;
  std::string peer_name;  // name hint from the line, resolved later
  std::string endpoint;
};

// One reconstructed connection interval.
struct Session {
  std::string peer_name;
  Timestamp start;
  Timestamp end;         // watermark when ongoing
  bool ongoing = false;  // no DISCONNECT seen before the end of the stream
  std::string endpoint;

  std::int64_t duration_seconds() const;
};

} // namespace wgsessions
