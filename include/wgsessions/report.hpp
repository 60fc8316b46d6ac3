#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "wgsessions/types.hpp"

namespace wgsessions {

enum class ReportFormat { kCsv, kJson };

bool parse_report_format(const std::string& s, ReportFormat& out);

// HH:MM:SS, hours not wrapped at 24 (90000 -> "25:00:00").
std::string format_duration(std::int64_t seconds);

// "Ongoing (as of <ts>)" for open sessions, the end timestamp otherwise.
std::string session_end_text(const Session& s);
// Adds " (up to last log)" for open sessions.
std::string session_duration_text(const Session& s);

// Quotes a CSV field when it contains a comma, quote, CR or LF.
std::string csv_escape(const std::string& field);

// Header row is always written, also for an empty list.
void write_csv_report(std::ostream& os, const std::vector<Session>& sessions);
void write_json_report(std::ostream& os, const std::vector<Session>& sessions);

bool write_report_file(const std::string& path, const std::vector<Session>& sessions,
                       ReportFormat format, std::string* error_out = nullptr);

} // namespace wgsessions
