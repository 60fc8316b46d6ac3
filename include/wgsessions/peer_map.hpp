#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace wgsessions {

// PeerKey -> display name, loaded from the peer map JSON:
//   { "alice-laptop": { "publicKey": "abc...=" }, ... }
class PeerNameMap {
public:
  void add(const std::string& key, const std::string& name);

  // Map entry for key wins; otherwise the hint recorded in the log line.
  std::string resolve(const std::string& key, const std::string& name_hint) const;

  std::size_t size() const { return by_key_.size(); }
  bool empty() const { return by_key_.empty(); }
  void clear() { by_key_.clear(); }

private:
  std::unordered_map<std::string, std::string> by_key_;
};

// Loads the map file into out. A missing or malformed file leaves out empty
// and fills *warning_out; the caller continues with log-embedded names.
bool load_peer_map(const std::string& path, PeerNameMap& out,
                   std::string* warning_out = nullptr);

// Same, from JSON text already in memory.
bool parse_peer_map(const std::string& text, PeerNameMap& out,
                    std::string* warning_out = nullptr);

} // namespace wgsessions
