#pragma once

#include <iosfwd>
#include <string>

#include "wgsessions/report.hpp"
#include "wgsessions/types.hpp"

namespace wgsessions {

struct RunConfig {
  std::string user = kAllPeers;
  std::string start_date_text;  // empty: derived from end date and days
  std::string end_date_text;    // empty: today
  std::string output;
  std::string map_file = "/root/script/ipaddr-map.json";
  std::string log_dir = "/var/log";
  std::string log_prefix = "wireguard-connections.log";
  int days = 3;
  ReportFormat format = ReportFormat::kCsv;
  bool quiet = false;

  // Filled by resolve_dates.
  Date start_date;
  Date end_date;
};

enum class ArgsResult { kRun, kHelp, kVersion, kError };

extern const char* const kVersion;

void print_usage(std::ostream& os);

bool parse_int(const std::string& s, int& out);

ArgsResult parse_args(int argc, const char* const* argv, RunConfig& cfg,
                      std::string* error_out = nullptr);

// End defaults to `today`, start to end - (days - 1). Fails on malformed
// dates and when start is after end.
bool resolve_dates(RunConfig& cfg, const Date& today, std::string* error_out = nullptr);

} // namespace wgsessions
