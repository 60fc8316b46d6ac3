#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "wgsessions/types.hpp"

namespace wgsessions {

enum class PeerStatus { kDisconnected, kConnected };

struct PeerSessionState {
  std::string peer_key;
  PeerStatus status = PeerStatus::kDisconnected;
  bool has_start = false;
  Timestamp session_start;
  std::string session_endpoint;
  std::string resolved_name = kUnknownPeer;

  // Adopts name unless it is the "Unknown" sentinel; a known name is never
  // replaced by "Unknown".
  void adopt_name(const std::string& name);
};

// Per-run peer table, keyed by PeerKey. Iteration follows first-seen order.
class PeerStateTable {
public:
  PeerSessionState& get_or_create(const std::string& peer_key);

  std::size_t size() const { return states_.size(); }
  const std::vector<PeerSessionState>& states() const { return states_; }

private:
  std::vector<PeerSessionState> states_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Feeds one event (in timestamp order) through the peer's state machine,
// appending a completed session to `out` on CONNECTED -> DISCONNECT.
void apply_event(PeerStateTable& peers, const LogEvent& ev, std::vector<Session>& out);

// Emits one ongoing session per peer still connected, ending at the
// stream-wide watermark.
void flush_open_sessions(const PeerStateTable& peers, const Timestamp& watermark,
                         std::vector<Session>& out);

// Runs the whole stream: completed sessions in the order they closed,
// followed by ongoing sessions in first-seen peer order. `events` must be
// sorted (see sort_events). The table is left in its final state.
std::vector<Session> reconstruct_sessions(const std::vector<LogEvent>& events,
                                          PeerStateTable& peers);

std::vector<Session> reconstruct_sessions(const std::vector<LogEvent>& events);

} // namespace wgsessions
