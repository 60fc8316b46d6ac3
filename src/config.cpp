#include "wgsessions/config.hpp"

#include <ostream>
#include <stdexcept>

#include "wgsessions/timestamp.hpp"

namespace wgsessions {

const char* const kVersion = "1.0";

void print_usage(std::ostream& os) {
  os << "Usage:\n"
     << "  wgsessions -o <path> [options]\n"
     << "  wgsessions --help\n"
     << "  wgsessions --version\n"
     << "\n"
     << "Options:\n"
     << "  -u, --user NAME         PeerName to report on, or 'all' (default all).\n"
     << "  -s, --start-date DATE   Start date YYYY-MM-DD (default: --days before end).\n"
     << "  -e, --end-date DATE     End date YYYY-MM-DD (default today).\n"
     << "  -o, --output PATH       Report file to write (required).\n"
     << "  --map-file PATH         Peer map JSON (default /root/script/ipaddr-map.json).\n"
     << "  --log-dir DIR           Log directory (default /var/log).\n"
     << "  --log-prefix PREFIX     Log file prefix (default wireguard-connections.log).\n"
     << "  --days N                Days covered when no start date is given,\n"
     << "                          end date included (default 3).\n"
     << "  --format csv|json       Report format (default csv).\n"
     << "  --quiet                 Only print warnings and errors.\n"
     << "  -h, --help              Print this help.\n"
     << "  --version               Print version.\n"
     << "\n"
     << "Examples:\n"
     << "  wgsessions -o sessions.csv\n"
     << "  wgsessions -u alice-laptop -s 2024-05-01 -e 2024-05-07 -o alice.csv\n"
     << "  wgsessions --log-dir ./logs --format json -o report.json\n";
}

bool parse_int(const std::string& s, int& out) {
  try {
    size_t idx = 0;
    int v = std::stoi(s, &idx, 10);
    if (idx != s.size()) return false;
    out = v;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

static bool takes_value(const std::string& flag) {
  static const char* const kValueFlags[] = {
      "-u", "--user", "-s", "--start-date", "-e", "--end-date", "-o", "--output",
      "--map-file", "--log-dir", "--log-prefix", "--days", "--format"};
  for (const char* f : kValueFlags) {
    if (flag == f) return true;
  }
  return false;
}

ArgsResult parse_args(int argc, const char* const* argv, RunConfig& cfg,
                      std::string* error_out) {
  // Global flags
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") return ArgsResult::kHelp;
    if (a == "--version") return ArgsResult::kVersion;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    const bool has_value = i + 1 < argc;

    if ((a == "-u" || a == "--user") && has_value) {
      cfg.user = argv[++i];
      continue;
    }
    if ((a == "-s" || a == "--start-date") && has_value) {
      cfg.start_date_text = argv[++i];
      continue;
    }
    if ((a == "-e" || a == "--end-date") && has_value) {
      cfg.end_date_text = argv[++i];
      continue;
    }
    if ((a == "-o" || a == "--output") && has_value) {
      cfg.output = argv[++i];
      continue;
    }
    if (a == "--map-file" && has_value) {
      cfg.map_file = argv[++i];
      continue;
    }
    if (a == "--log-dir" && has_value) {
      cfg.log_dir = argv[++i];
      continue;
    }
    if (a == "--log-prefix" && has_value) {
      cfg.log_prefix = argv[++i];
      continue;
    }
    if (a == "--days" && has_value) {
      int v = 0;
      if (!parse_int(argv[++i], v) || v <= 0) {
        if (error_out) *error_out = "Invalid --days value (must be a positive integer).";
        return ArgsResult::kError;
      }
      cfg.days = v;
      continue;
    }
    if (a == "--format" && has_value) {
      if (!parse_report_format(argv[++i], cfg.format)) {
        if (error_out) *error_out = "Invalid --format. Use: csv or json";
        return ArgsResult::kError;
      }
      continue;
    }
    if (a == "--quiet") {
      cfg.quiet = true;
      continue;
    }

    if (error_out) {
      *error_out = takes_value(a) ? "Missing value for " + a : "Unknown argument: " + a;
    }
    return ArgsResult::kError;
  }

  if (cfg.output.empty()) {
    if (error_out) *error_out = "Missing -o/--output <path>";
    return ArgsResult::kError;
  }
  return ArgsResult::kRun;
}

bool resolve_dates(RunConfig& cfg, const Date& today, std::string* error_out) {
  if (cfg.end_date_text.empty()) {
    cfg.end_date = today;
  } else if (!parse_date(cfg.end_date_text, cfg.end_date)) {
    if (error_out) *error_out = "Invalid end date '" + cfg.end_date_text + "' (expected YYYY-MM-DD).";
    return false;
  }

  if (cfg.start_date_text.empty()) {
    cfg.start_date = add_days(cfg.end_date, -(cfg.days - 1));
  } else if (!parse_date(cfg.start_date_text, cfg.start_date)) {
    if (error_out) {
      *error_out = "Invalid start date '" + cfg.start_date_text + "' (expected YYYY-MM-DD).";
    }
    return false;
  }

  if (cfg.end_date < cfg.start_date) {
    if (error_out) {
      *error_out = "Start date (" + format_date(cfg.start_date) +
                   ") cannot be after end date (" + format_date(cfg.end_date) + ").";
    }
    return false;
  }
  return true;
}

} // namespace wgsessions
