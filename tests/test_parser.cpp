#include "wgsessions/parser.hpp"

#include <iostream>
#include <string>

#include "wgsessions/timestamp.hpp"

using namespace wgsessions;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
  do { \
    if (!(cond)) { \
      std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
      tests_failed++; \
      return false; \
    } \
  } while (0)

static const char* kKey = "hJ3m9x+Qb1/abcDEF0123456789abcdefGHIJklmnoP=";

bool test_connect_line() {
  const std::string line = std::string("2024-05-01T10:00:00+08:00 CONNECT PeerName='alice' PeerKey=") +
                           kKey + " Endpoint=203.0.113.5:51820";
  LogEvent ev;
  TEST_ASSERT(parse_log_line(line, ev) == LineParse::kOk, "parse CONNECT");
  TEST_ASSERT(ev.event == "CONNECT", "event");
  TEST_ASSERT(ev.qualifier.empty(), "no qualifier");
  TEST_ASSERT(ev.klass == EventClass::kConnect, "connect class");
  TEST_ASSERT(ev.peer_name == "alice", "name");
  TEST_ASSERT(ev.peer_key == kKey, "key keeps '=' and '/'");
  TEST_ASSERT(ev.endpoint == "203.0.113.5:51820", "endpoint");
  TEST_ASSERT(format_timestamp(ev.timestamp) == "2024-05-01T10:00:00+08:00", "timestamp");
  return true;
}

bool test_qualified_disconnect() {
  LogEvent ev;
  const std::string line =
      "2024-05-01T11:00:00+08:00   DISCONNECT (Timeout)\tPeerName='Unknown' PeerKey=K1 Endpoint=(none)";
  TEST_ASSERT(parse_log_line(line, ev) == LineParse::kOk, "parse DISCONNECT (Timeout)");
  TEST_ASSERT(ev.event == "DISCONNECT", "primary classifier only");
  TEST_ASSERT(ev.qualifier == "Timeout", "qualifier kept aside");
  TEST_ASSERT(ev.klass == EventClass::kDisconnect, "disconnect class");
  TEST_ASSERT(ev.peer_name == "Unknown", "sentinel name");
  TEST_ASSERT(ev.endpoint == "(none)", "endpoint is opaque");

  TEST_ASSERT(parse_log_line("2024-05-01T11:00:00+08:00 DISCONNECT (Removed) PeerName='bob' "
                             "PeerKey=K2 Endpoint=198.51.100.7:40000",
                             ev) == LineParse::kOk,
              "parse DISCONNECT (Removed)");
  TEST_ASSERT(ev.event == "DISCONNECT" && ev.qualifier == "Removed", "removed");
  return true;
}

bool test_multiword_qualifier_and_update() {
  LogEvent ev;
  TEST_ASSERT(parse_log_line("2024-05-01T12:00:00+08:00 UPDATE (IP Change) PeerName='bob' "
                             "PeerKey=K2 Endpoint=198.51.100.8:40000",
                             ev) == LineParse::kOk,
              "parse UPDATE (IP Change)");
  TEST_ASSERT(ev.event == "UPDATE", "primary");
  TEST_ASSERT(ev.qualifier == "IP Change", "qualifier with space");
  TEST_ASSERT(ev.klass == EventClass::kOther, "UPDATE opens nothing");

  TEST_ASSERT(parse_log_line("2024-05-01T12:01:00+08:00 RECONNECT/UPDATE PeerName='bob' "
                             "PeerKey=K2 Endpoint=198.51.100.8:40000",
                             ev) == LineParse::kOk,
              "parse RECONNECT/UPDATE");
  TEST_ASSERT(ev.klass == EventClass::kConnect, "reconnect is connect-class");
  return true;
}

bool test_classify() {
  TEST_ASSERT(classify_event("CONNECT") == EventClass::kConnect, "CONNECT");
  TEST_ASSERT(classify_event("RECONNECT/UPDATE") == EventClass::kConnect, "RECONNECT/UPDATE");
  TEST_ASSERT(classify_event("RECONNECT") == EventClass::kOther, "bare RECONNECT");
  TEST_ASSERT(classify_event("DISCONNECT") == EventClass::kDisconnect, "DISCONNECT");
  TEST_ASSERT(classify_event("DISCONNECT_TIMEOUT") == EventClass::kDisconnect, "subtype");
  TEST_ASSERT(classify_event("ERROR") == EventClass::kOther, "ERROR");
  return true;
}

bool test_empty_name_and_trailing_text() {
  LogEvent ev;
  TEST_ASSERT(parse_log_line("2024-05-01T10:00:00+00:00 CONNECT PeerName='' PeerKey=K "
                             "Endpoint=10.0.0.1:1 extra trailing words\r",
                             ev) == LineParse::kOk,
              "trailing text ignored");
  TEST_ASSERT(ev.peer_name.empty(), "empty name");
  TEST_ASSERT(ev.endpoint == "10.0.0.1:1", "endpoint stops at whitespace");

  TEST_ASSERT(parse_log_line("2024-05-01T10:00:00+00:00 CONNECT PeerName='carol smith' "
                             "PeerKey=K Endpoint=10.0.0.1:1",
                             ev) == LineParse::kOk,
              "name with space");
  TEST_ASSERT(ev.peer_name == "carol smith", "name with space kept");
  return true;
}

bool test_rejected_lines() {
  LogEvent ev;
  TEST_ASSERT(parse_log_line("", ev) == LineParse::kNoMatch, "blank");
  TEST_ASSERT(parse_log_line("2024-05-01T10:00:00+08:00 ERROR Failed to run 'wg show wg0 dump'", ev) ==
              LineParse::kNoMatch,
              "system error line");
  TEST_ASSERT(parse_log_line(" 2024-05-01T10:00:00+08:00 CONNECT PeerName='a' PeerKey=K Endpoint=E", ev) ==
              LineParse::kNoMatch,
              "leading whitespace");
  TEST_ASSERT(parse_log_line("2024-05-01T10:00:00+08:00 CONNECT PeerName='a PeerKey=K Endpoint=E", ev) ==
              LineParse::kNoMatch,
              "unterminated name");
  TEST_ASSERT(parse_log_line("2024-05-01T10:00:00+08:00 CONNECT PeerName='a' PeerKey=K", ev) ==
              LineParse::kNoMatch,
              "missing endpoint");
  TEST_ASSERT(parse_log_line("2024-05-01T10:00:00+08:00 CONNECT PeerName='a' PeerKey=K Endpoint=", ev) ==
              LineParse::kNoMatch,
              "empty endpoint");
  TEST_ASSERT(parse_log_line("2024-05-01T10:00:00+0800 CONNECT PeerName='a' PeerKey=K Endpoint=E", ev) ==
              LineParse::kNoMatch,
              "offset without colon");
  TEST_ASSERT(parse_log_line("DEBUG: LOG_EVENT: Type=CONNECT, Key=>K<", ev) == LineParse::kNoMatch, "debug");
  return true;
}

bool test_bad_timestamp_warns() {
  LogEvent ev;
  std::string warning;
  const LineParse r = parse_log_line(
      "2024-02-30T10:00:00+08:00 CONNECT PeerName='a' PeerKey=K Endpoint=E", ev, &warning);
  TEST_ASSERT(r == LineParse::kBadTimestamp, "impossible date");
  TEST_ASSERT(warning.find("2024-02-30T10:00:00+08:00") != std::string::npos, "warning names value");
  return true;
}

bool test_fields_reserialize() {
  const char* lines[] = {
    "2024-05-01T10:00:00+08:00 CONNECT PeerName='alice' PeerKey=K1= Endpoint=1.2.3.4:5",
    "2023-12-31T23:59:59-03:00 DISCONNECT PeerName='bob' PeerKey=K2 Endpoint=[2001:db8::1]:51820",
    "2024-06-15T00:00:00+00:00 RECONNECT/UPDATE PeerName='Unknown' PeerKey=K3 Endpoint=9.9.9.9:1",
  };
  for (const char* line : lines) {
    LogEvent ev;
    TEST_ASSERT(parse_log_line(line, ev) == LineParse::kOk, "parse " << line);
    const std::string again = format_timestamp(ev.timestamp) + " " + ev.event + " PeerName='" +
                              ev.peer_name + "' PeerKey=" + ev.peer_key + " Endpoint=" + ev.endpoint;
    TEST_ASSERT(again == line, "re-serialized " << again);
  }
  return true;
}

bool test_short_line_preview() {
  TEST_ASSERT(short_line_preview("abc") == "abc", "short unchanged");
  const std::string longer(500, 'x');
  TEST_ASSERT(short_line_preview(longer).size() == 163, "truncated with ellipsis");
  return true;
}

int main() {
  std::cout << "Running line parser tests..." << std::endl;

  test_connect_line();
  test_qualified_disconnect();
  test_multiword_qualifier_and_update();
  test_classify();
  test_empty_name_and_trailing_text();
  test_rejected_lines();
  test_bad_timestamp_warns();
  test_fields_reserialize();
  test_short_line_preview();

  if (tests_failed == 0) {
    std::cout << "ALL LINE PARSER TESTS PASSED" << std::endl;
    return 0;
  }
  std::cerr << tests_failed << " TESTS FAILED" << std::endl;
  return 1;
}
