#include "wgsessions/parser.hpp"

#include <cctype>
#include <string>

#include "wgsessions/timestamp.hpp"

namespace wgsessions {

static bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Advances over a run of whitespace; false if there was none.
static bool skip_spaces(const std::string& s, size_t& pos) {
  const size_t start = pos;
  while (pos < s.size() && is_space(s[pos])) ++pos;
  return pos > start;
}

// Reads a run of non-whitespace; false if empty.
static bool read_token(const std::string& s, size_t& pos, std::string& out) {
  const size_t start = pos;
  while (pos < s.size() && !is_space(s[pos])) ++pos;
  if (pos == start) return false;
  out = s.substr(start, pos - start);
  return true;
}

static bool consume(const std::string& s, size_t& pos, const char* literal) {
  const std::string lit(literal);
  if (s.compare(pos, lit.size(), lit) != 0) return false;
  pos += lit.size();
  return true;
}

// "(Timeout)" -> "Timeout". Leaves pos untouched on failure.
static bool read_qualifier(const std::string& s, size_t& pos, std::string& out) {
  if (pos >= s.size() || s[pos] != '(') return false;
  const size_t close = s.find(')', pos + 1);
  if (close == std::string::npos || close == pos + 1) return false;
  out = s.substr(pos + 1, close - pos - 1);
  pos = close + 1;
  return true;
}

std::string short_line_preview(const std::string& line) {
  const size_t max_len = 160;
  if (line.size() <= max_len) return line;
  return line.substr(0, max_len) + "...";
}

EventClass classify_event(const std::string& primary) {
  if (primary == "CONNECT" || primary == "RECONNECT/UPDATE") return EventClass::kConnect;
  if (primary.compare(0, 10, "DISCONNECT") == 0) return EventClass::kDisconnect;
  return EventClass::kOther;
}

LineParse parse_log_line(const std::string& raw, LogEvent& out, std::string* warning_out) {
  std::string line = raw;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

  size_t pos = 0;

  std::string ts_text;
  if (!read_token(line, pos, ts_text)) return LineParse::kNoMatch;
  if (!skip_spaces(line, pos)) return LineParse::kNoMatch;

  std::string event;
  if (!read_token(line, pos, event)) return LineParse::kNoMatch;
  if (!skip_spaces(line, pos)) return LineParse::kNoMatch;

  // Optional "(qualifier)" between the event token and the name field.
  std::string qualifier;
  {
    size_t probe = pos;
    std::string q;
    if (read_qualifier(line, probe, q) && skip_spaces(line, probe)) {
      qualifier = q;
      pos = probe;
    }
  }

  if (!consume(line, pos, "PeerName='")) return LineParse::kNoMatch;
  const size_t name_end = line.find('\'', pos);
  if (name_end == std::string::npos) return LineParse::kNoMatch;
  std::string name = line.substr(pos, name_end - pos);
  pos = name_end + 1;
  if (!skip_spaces(line, pos)) return LineParse::kNoMatch;

  std::string key;
  if (!consume(line, pos, "PeerKey=")) return LineParse::kNoMatch;
  if (!read_token(line, pos, key)) return LineParse::kNoMatch;
  if (!skip_spaces(line, pos)) return LineParse::kNoMatch;

  std::string endpoint;
  if (!consume(line, pos, "Endpoint=")) return LineParse::kNoMatch;
  if (!read_token(line, pos, endpoint)) return LineParse::kNoMatch;

  Timestamp ts;
  switch (parse_timestamp(ts_text, ts)) {
    case TimestampParse::kOk:
      break;
    case TimestampParse::kBadShape:
      return LineParse::kNoMatch;
    case TimestampParse::kBadValue:
      if (warning_out) {
        *warning_out = "Skipping line due to timestamp parse error: " + ts_text +
                       ". Line: " + short_line_preview(line);
      }
      return LineParse::kBadTimestamp;
  }

  out.timestamp = ts;
  out.event = event;
  out.qualifier = qualifier;
  out.klass = classify_event(event);
  out.peer_key = key;
  out.peer_name = name;
  out.endpoint = endpoint;
  return LineParse::kOk;
}

} // namespace wgsessions
