#pragma once

#include <string>

#include "wgsessions/types.hpp"

namespace wgsessions {

enum class LineParse {
  kOk,
  kNoMatch,      // not a connection record (blank, ERROR line, garbage)
  kBadTimestamp  // record shape, but the timestamp values are invalid
};

// Parses one log line:
//   <timestamp> <EVENT>[ (qualifier)] PeerName='<name>' PeerKey=<key> Endpoint=<addr>
// On kBadTimestamp, *warning_out (if given) describes the rejected value.
LineParse parse_log_line(const std::string& line, LogEvent& out,
                         std::string* warning_out = nullptr);

// Maps a primary event token to its session-boundary class.
EventClass classify_event(const std::string& primary);

// Truncates long lines for diagnostics.
std::string short_line_preview(const std::string& line);

} // namespace wgsessions
