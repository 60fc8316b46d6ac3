#include "wgsessions/peer_map.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace wgsessions {

// Document order matters: a key declared twice maps to the later name.
using json = nlohmann::ordered_json;

void PeerNameMap::add(const std::string& key, const std::string& name) {
  by_key_[key] = name;
}

std::string PeerNameMap::resolve(const std::string& key, const std::string& name_hint) const {
  auto it = by_key_.find(key);
  if (it != by_key_.end()) return it->second;
  return name_hint;
}

bool parse_peer_map(const std::string& text, PeerNameMap& out, std::string* warning_out) {
  out.clear();

  try {
    const json j = json::parse(text);
    if (!j.is_object()) {
      if (warning_out) *warning_out = "peer map is not a JSON object";
      return false;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
      const json& details = it.value();
      if (!details.is_object()) continue;

      auto key = details.find("publicKey");
      if (key == details.end() || !key->is_string()) continue;
      out.add(key->get<std::string>(), it.key());
    }
    return true;
  } catch (const json::exception& e) {
    out.clear();
    if (warning_out) *warning_out = e.what();
    return false;
  }
}

bool load_peer_map(const std::string& path, PeerNameMap& out, std::string* warning_out) {
  out.clear();

  std::ifstream in(path);
  if (!in) {
    if (warning_out) {
      *warning_out = "Peer map file not found at " + path + ". Names might be 'Unknown'.";
    }
    return false;
  }

  std::ostringstream ss;
  ss << in.rdbuf();

  std::string err;
  if (!parse_peer_map(ss.str(), out, &err)) {
    if (warning_out) {
      *warning_out = "Could not load or parse peer map file " + path + ": " + err;
    }
    return false;
  }
  return true;
}

} // namespace wgsessions
