#include "wgsessions/app.hpp"

#include <ostream>
#include <string>
#include <vector>

#include "wgsessions/event_stream.hpp"
#include "wgsessions/peer_map.hpp"
#include "wgsessions/reconstructor.hpp"
#include "wgsessions/report.hpp"
#include "wgsessions/timestamp.hpp"

namespace wgsessions {

int run_report(RunConfig cfg, const Date& today, std::ostream& out, std::ostream& err) {
  std::string error;
  if (!resolve_dates(cfg, today, &error)) {
    err << "Error: " << error << "\n";
    return 1;
  }

  PeerNameMap names;
  std::string warning;
  if (!load_peer_map(cfg.map_file, names, &warning)) {
    err << "Warning: " << warning << "\n";
  } else if (names.empty()) {
    err << "Warning: Peer map file " << cfg.map_file << " declares no publicKey entries.\n";
  } else if (!cfg.quiet) {
    out << "Loaded " << names.size() << " peer names from " << cfg.map_file << "\n";
  }

  StreamOptions opts;
  opts.log_dir = cfg.log_dir;
  opts.log_prefix = cfg.log_prefix;
  opts.start_date = cfg.start_date;
  opts.end_date = cfg.end_date;
  opts.peer = cfg.user;

  if (!cfg.quiet) {
    out << "Scanning log files in " << cfg.log_dir << " matching " << cfg.log_prefix
        << "* from " << format_date(cfg.start_date) << " to " << format_date(cfg.end_date)
        << "...\n";
  }

  std::vector<LogEvent> events;
  StreamStats stats;
  if (!build_event_stream(opts, names, events, err, &stats, &error)) {
    err << "Error: " << error << "\n";
    return 1;
  }

  if (!cfg.quiet) {
    out << "Read " << stats.lines_read << " lines from " << stats.files_read << " of "
        << stats.files_found << " files (" << stats.lines_unmatched << " unmatched, "
        << stats.lines_bad_timestamp << " bad timestamps, " << stats.events_out_of_range
        << " out of range, " << stats.events_other_peer << " other peers).\n";
  }

  if (events.empty()) {
    out << "No relevant log entries found for the specified user and date range.\n";
  }

  PeerStateTable peers;
  const std::vector<Session> sessions = reconstruct_sessions(events, peers);

  if (!cfg.quiet) {
    out << "Found " << sessions.size() << " sessions across " << peers.size() << " peers.\n";
  }
  if (sessions.empty() && !events.empty()) {
    out << "No sessions found for the specified user and date range.\n";
  }

  if (!write_report_file(cfg.output, sessions, cfg.format, &error)) {
    err << "Error: " << error << "\n";
    return 1;
  }

  if (!cfg.quiet) out << "Report written to " << cfg.output << "\n";
  return 0;
}

} // namespace wgsessions
