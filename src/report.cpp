#include "wgsessions/report.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <ostream>

#include "wgsessions/timestamp.hpp"

namespace wgsessions {

using json = nlohmann::ordered_json;

static const char* const kColumns[] = {
    "PeerName", "SessionStart", "SessionEnd", "Duration (HH:MM:SS)", "EndpointIP"};

bool parse_report_format(const std::string& s, ReportFormat& out) {
  if (s == "csv") {
    out = ReportFormat::kCsv;
    return true;
  }
  if (s == "json") {
    out = ReportFormat::kJson;
    return true;
  }
  return false;
}

std::string format_duration(std::int64_t seconds) {
  if (seconds < 0) seconds = 0;
  const long long hours = seconds / 3600;
  const int minutes = static_cast<int>((seconds % 3600) / 60);
  const int secs = static_cast<int>(seconds % 60);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02d:%02d", hours, minutes, secs);
  return buf;
}

std::string session_end_text(const Session& s) {
  if (s.ongoing) return "Ongoing (as of " + format_timestamp(s.end) + ")";
  return format_timestamp(s.end);
}

std::string session_duration_text(const Session& s) {
  std::string text = format_duration(s.duration_seconds());
  if (s.ongoing) text += " (up to last log)";
  return text;
}

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

  std::string out;
  out.reserve(field.size() + 2);
  out += '"';
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

static void write_csv_row(std::ostream& os, const std::string* cols, size_t n) {
  for (size_t i = 0; i < n; ++i) {
    if (i) os << ',';
    os << csv_escape(cols[i]);
  }
  os << "\r\n";
}

void write_csv_report(std::ostream& os, const std::vector<Session>& sessions) {
  const std::string header[5] = {kColumns[0], kColumns[1], kColumns[2], kColumns[3],
                                 kColumns[4]};
  write_csv_row(os, header, 5);

  for (const Session& s : sessions) {
    const std::string row[5] = {s.peer_name, format_timestamp(s.start), session_end_text(s),
                                session_duration_text(s), s.endpoint};
    write_csv_row(os, row, 5);
  }
}

void write_json_report(std::ostream& os, const std::vector<Session>& sessions) {
  json doc = json::array();
  for (const Session& s : sessions) {
    json row;
    row[kColumns[0]] = s.peer_name;
    row[kColumns[1]] = format_timestamp(s.start);
    row[kColumns[2]] = session_end_text(s);
    row[kColumns[3]] = session_duration_text(s);
    row[kColumns[4]] = s.endpoint;
    row["ongoing"] = s.ongoing;
    row["duration_seconds"] = s.duration_seconds();
    doc.push_back(row);
  }
  // Names come straight from log files and need not be valid UTF-8.
  os << doc.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

bool write_report_file(const std::string& path, const std::vector<Session>& sessions,
                       ReportFormat format, std::string* error_out) {
  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    if (error_out) {
      *error_out = "Failed to open output file " + path + ": " + std::strerror(errno);
    }
    return false;
  }

  if (format == ReportFormat::kJson) {
    write_json_report(out, sessions);
  } else {
    write_csv_report(out, sessions);
  }

  out.flush();
  if (!out) {
    if (error_out) *error_out = "Failed to write output file " + path;
    return false;
  }
  return true;
}

} // namespace wgsessions
