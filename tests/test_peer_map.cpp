#include "wgsessions/peer_map.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace wgsessions;
namespace fs = std::filesystem;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
  do { \
    if (!(cond)) { \
      std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
      tests_failed++; \
      return false; \
    } \
  } while (0)

static fs::path make_workdir() {
  fs::path dir = fs::temp_directory_path() / ("wgsessions_peer_map_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

bool test_map_wins_over_hint() {
  PeerNameMap names;
  std::string warning;
  TEST_ASSERT(parse_peer_map(R"({"Bob": {"publicKey": "K", "address": "10.8.0.2"}})", names, &warning),
              "parse map");
  TEST_ASSERT(names.size() == 1, "one entry");
  TEST_ASSERT(names.resolve("K", "Eve") == "Bob", "map name wins over embedded name");
  TEST_ASSERT(names.resolve("K", "Unknown") == "Bob", "map name wins over Unknown");
  TEST_ASSERT(names.resolve("other", "Eve") == "Eve", "fallback to hint");
  TEST_ASSERT(names.resolve("other", "Unknown") == "Unknown", "fallback may be Unknown");
  return true;
}

bool test_entries_without_key_skipped() {
  PeerNameMap names;
  const char* text = R"({
    "alice": {"publicKey": "KA"},
    "nokey": {"address": "10.8.0.9"},
    "numeric": {"publicKey": 42},
    "scalar": "KS",
    "carol": {"publicKey": "KC"}
  })";
  TEST_ASSERT(parse_peer_map(text, names), "parse");
  TEST_ASSERT(names.size() == 2, "only string publicKey entries kept");
  TEST_ASSERT(names.resolve("KA", "x") == "alice" && names.resolve("KC", "x") == "carol", "alice and carol");
  return true;
}

bool test_duplicate_key_later_wins() {
  PeerNameMap names;
  TEST_ASSERT(parse_peer_map(R"({"zed": {"publicKey": "K"}, "amy": {"publicKey": "K"}})", names),
              "parse");
  TEST_ASSERT(names.resolve("K", "x") == "amy", "later entry in document order wins");
  return true;
}

bool test_malformed_map_is_empty() {
  PeerNameMap names;
  names.add("stale", "old");
  std::string warning;
  TEST_ASSERT(!parse_peer_map("{ not json", names, &warning), "malformed rejected");
  TEST_ASSERT(names.empty(), "map empty after failure");
  TEST_ASSERT(!warning.empty(), "diagnostic filled");

  TEST_ASSERT(!parse_peer_map("[1, 2, 3]", names, &warning), "array rejected");
  TEST_ASSERT(names.empty(), "still empty");
  return true;
}

bool test_load_from_file() {
  const fs::path dir = make_workdir();
  const fs::path path = dir / "ipaddr-map.json";
  {
    std::ofstream out(path);
    out << R"({"Bob": {"publicKey": "K"}})";
  }

  PeerNameMap names;
  std::string warning;
  TEST_ASSERT(load_peer_map(path.string(), names, &warning), "load existing file");
  TEST_ASSERT(names.resolve("K", "Eve") == "Bob", "loaded entry");

  TEST_ASSERT(!load_peer_map((dir / "missing.json").string(), names, &warning), "missing file");
  TEST_ASSERT(names.empty(), "missing file gives empty map");
  TEST_ASSERT(warning.find("not found") != std::string::npos, "missing file diagnostic");

  const fs::path bad = dir / "bad.json";
  {
    std::ofstream out(bad);
    out << "{\"Bob\": ";
  }
  TEST_ASSERT(!load_peer_map(bad.string(), names, &warning), "truncated file");
  TEST_ASSERT(warning.find("Could not load or parse") != std::string::npos, "parse diagnostic");

  fs::remove_all(dir);
  return true;
}

int main() {
  std::cout << "Running peer map tests..." << std::endl;

  test_map_wins_over_hint();
  test_entries_without_key_skipped();
  test_duplicate_key_later_wins();
  test_malformed_map_is_empty();
  test_load_from_file();

  if (tests_failed == 0) {
    std::cout << "ALL PEER MAP TESTS PASSED" << std::endl;
    return 0;
  }
  std::cerr << tests_failed << " TESTS FAILED" << std::endl;
  return 1;
}
