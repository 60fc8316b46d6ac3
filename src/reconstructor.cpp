#include "wgsessions/reconstructor.hpp"

namespace wgsessions {

void PeerSessionState::adopt_name(const std::string& name) {
  if (name == kUnknownPeer) return;
  resolved_name = name;
}

PeerSessionState& PeerStateTable::get_or_create(const std::string& peer_key) {
  auto it = index_.find(peer_key);
  if (it != index_.end()) return states_[it->second];

  index_.emplace(peer_key, states_.size());
  states_.emplace_back();
  states_.back().peer_key = peer_key;
  return states_.back();
}

void apply_event(PeerStateTable& peers, const LogEvent& ev, std::vector<Session>& out) {
  PeerSessionState& st = peers.get_or_create(ev.peer_key);
  st.adopt_name(ev.peer_name);

  switch (ev.klass) {
    case EventClass::kConnect:
      if (st.status == PeerStatus::kDisconnected) {
        st.status = PeerStatus::kConnected;
        st.has_start = true;
        st.session_start = ev.timestamp;
        st.session_endpoint = ev.endpoint;
      }
      break;

    case EventClass::kDisconnect:
      // A disconnect while already disconnected is a duplicate; ignore it.
      if (st.status == PeerStatus::kConnected) {
        Session s;
        s.peer_name = st.resolved_name;
        s.start = st.session_start;
        s.end = ev.timestamp;
        s.endpoint = st.session_endpoint;
        out.push_back(s);

        st.status = PeerStatus::kDisconnected;
        st.has_start = false;
        st.session_start = Timestamp{};
        st.session_endpoint.clear();
      }
      break;

    case EventClass::kOther:
      break;
  }
}

void flush_open_sessions(const PeerStateTable& peers, const Timestamp& watermark,
                         std::vector<Session>& out) {
  for (const PeerSessionState& st : peers.states()) {
    if (st.status != PeerStatus::kConnected || !st.has_start) continue;

    Session s;
    s.peer_name = st.resolved_name;
    s.start = st.session_start;
    s.end = watermark;
    s.ongoing = true;
    s.endpoint = st.session_endpoint;
    out.push_back(s);
  }
}

std::vector<Session> reconstruct_sessions(const std::vector<LogEvent>& events,
                                          PeerStateTable& peers) {
  std::vector<Session> sessions;
  for (const LogEvent& ev : events) apply_event(peers, ev, sessions);

  // No events, no watermark: nothing can be open.
  if (!events.empty()) flush_open_sessions(peers, events.back().timestamp, sessions);
  return sessions;
}

std::vector<Session> reconstruct_sessions(const std::vector<LogEvent>& events) {
  PeerStateTable peers;
  return reconstruct_sessions(events, peers);
}

} // namespace wgsessions
