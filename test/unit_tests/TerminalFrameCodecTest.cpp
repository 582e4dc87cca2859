#include "TerminalFrameCodec.hpp"

#include "SyncError.hpp"
#include "TestHeaders.hpp"

using namespace jm;

TEST_CASE("Framed chunks carry their session id", "[TerminalFrameCodec]") {
  string raw = TerminalFrameCodec::encode("session-1", "hello");
  REQUIRE(raw.substr(0, 4) == "PTC1");
  REQUIRE(raw[4] == 0);
  REQUIRE(raw[5] == 9);

  TerminalFrame frame = TerminalFrameCodec::decode(raw, 1234);
  REQUIRE(frame.session_id() == "session-1");
  REQUIRE(frame.payload() == "hello");
  REQUIRE(frame.received_at_ms() == 1234);
}

TEST_CASE("Untagged and malformed chunks are raw payload",
          "[TerminalFrameCodec]") {
  SECTION("No sentinel") {
    TerminalFrame frame = TerminalFrameCodec::decode("plain output", 5);
    REQUIRE(frame.session_id() == "");
    REQUIRE(frame.payload() == "plain output");
  }

  SECTION("Sentinel with a length past the end") {
    string raw = "PTC1";
    raw.push_back(char(0));
    raw.push_back(char(40));
    raw.append("short");
    TerminalFrame frame = TerminalFrameCodec::decode(raw, 5);
    REQUIRE(frame.session_id() == "");
    REQUIRE(frame.payload() == raw);
  }

  SECTION("Sentinel alone") {
    TerminalFrame frame = TerminalFrameCodec::decode("PTC1", 5);
    REQUIRE(frame.payload() == "PTC1");
  }
}

TEST_CASE("Long session ids use both length bytes", "[TerminalFrameCodec]") {
  string sessionId(300, 's');
  string raw = TerminalFrameCodec::encode(sessionId, string("\x00\x01", 2));
  REQUIRE(uint8_t(raw[4]) == 1);
  REQUIRE(uint8_t(raw[5]) == 44);
  TerminalFrame frame = TerminalFrameCodec::decode(raw, 0);
  REQUIRE(frame.session_id() == sessionId);
  REQUIRE(frame.payload() == string("\x00\x01", 2));

  REQUIRE_THROWS_AS(TerminalFrameCodec::encode(string(0x10000, 'x'), "p"),
                    SyncError);
}
