#include "wgsessions/event_stream.hpp"

#include <algorithm>
#include <ostream>

#include "wgsessions/log_source.hpp"
#include "wgsessions/parser.hpp"

namespace wgsessions {

bool accept_event(LogEvent& ev, const StreamOptions& opts, const PeerNameMap& names,
                  StreamStats* stats) {
  const Date& d = ev.timestamp.date;
  if (d < opts.start_date || opts.end_date < d) {
    if (stats) ++stats->events_out_of_range;
    return false;
  }

  ev.peer_name = names.resolve(ev.peer_key, ev.peer_name);

  if (opts.peer != kAllPeers && ev.peer_name != opts.peer) {
    if (stats) ++stats->events_other_peer;
    return false;
  }
  return true;
}

void sort_events(std::vector<LogEvent>& events) {
  std::stable_sort(events.begin(), events.end(), [](const LogEvent& a, const LogEvent& b) {
    return a.timestamp.epoch_seconds() < b.timestamp.epoch_seconds();
  });
}

bool build_event_stream(const StreamOptions& opts, const PeerNameMap& names,
                        std::vector<LogEvent>& out, std::ostream& warn,
                        StreamStats* stats, std::string* error_out) {
  out.clear();
  StreamStats local;
  StreamStats& st = stats ? *stats : local;
  st = StreamStats{};

  std::vector<std::string> files;
  std::string err;
  if (!list_log_files(opts.log_dir, opts.log_prefix, files, &err)) {
    if (error_out) *error_out = err;
    return false;
  }

  st.files_found = static_cast<std::int64_t>(files.size());
  if (files.empty()) {
    if (error_out) {
      *error_out = "No log files found matching " + opts.log_prefix + "* in " + opts.log_dir + ".";
    }
    return false;
  }

  for (const std::string& path : files) {
    // Events of a file are merged only once the whole file was read.
    std::vector<LogEvent> file_events;
    StreamStats file_st;

    bool ok = for_each_line(
        path,
        [&](const std::string& line) {
          ++file_st.lines_read;

          LogEvent ev;
          std::string line_warning;
          switch (parse_log_line(line, ev, &line_warning)) {
            case LineParse::kNoMatch:
              ++file_st.lines_unmatched;
              return;
            case LineParse::kBadTimestamp:
              ++file_st.lines_bad_timestamp;
              warn << "Warning: " << line_warning << "\n";
              return;
            case LineParse::kOk:
              break;
          }

          if (!accept_event(ev, opts, names, &file_st)) return;
          file_events.push_back(ev);
        },
        &err);

    if (!ok) {
      ++st.files_failed;
      warn << "Warning: Could not process file " << path << ": " << err << "\n";
      continue;
    }

    ++st.files_read;
    st.lines_read += file_st.lines_read;
    st.lines_unmatched += file_st.lines_unmatched;
    st.lines_bad_timestamp += file_st.lines_bad_timestamp;
    st.events_out_of_range += file_st.events_out_of_range;
    st.events_other_peer += file_st.events_other_peer;
    out.insert(out.end(), file_events.begin(), file_events.end());
  }

  if (st.files_read == 0) {
    if (error_out) {
      *error_out = "No log files could be processed in " + opts.log_dir + ".";
    }
    return false;
  }

  sort_events(out);
  st.events_kept = static_cast<std::int64_t>(out.size());
  return true;
}

} // namespace wgsessions
