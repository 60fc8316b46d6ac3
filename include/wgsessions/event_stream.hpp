#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "wgsessions/peer_map.hpp"
#include "wgsessions/types.hpp"

namespace wgsessions {

struct StreamOptions {
  std::string log_dir;
  std::string log_prefix;
  Date start_date;
  Date end_date;                 // inclusive
  std::string peer = kAllPeers;  // resolved name, or "all"
};

struct StreamStats {
  std::int64_t files_found = 0;
  std::int64_t files_read = 0;
  std::int64_t files_failed = 0;
  std::int64_t lines_read = 0;
  std::int64_t lines_unmatched = 0;
  std::int64_t lines_bad_timestamp = 0;
  std::int64_t events_out_of_range = 0;
  std::int64_t events_other_peer = 0;
  std::int64_t events_kept = 0;
};

// Applies the date filter, then name resolution, then the peer filter.
// Returns false if the event is dropped; ev.peer_name holds the resolved
// name afterwards.
bool accept_event(LogEvent& ev, const StreamOptions& opts, const PeerNameMap& names,
                  StreamStats* stats = nullptr);

// Stable sort by instant; equal instants keep encounter order.
void sort_events(std::vector<LogEvent>& events);

// Reads every matching log file and returns the filtered events in
// timestamp order. Per-line and per-file problems are written to `warn`
// and skipped. Returns false (fatal) when no source file was found or none
// of the found files could be read.
bool build_event_stream(const StreamOptions& opts, const PeerNameMap& names,
                        std::vector<LogEvent>& out, std::ostream& warn,
                        StreamStats* stats = nullptr, std::string* error_out = nullptr);

} // namespace wgsessions
