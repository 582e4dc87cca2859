#include "TerminalFrameCodec.hpp"

#include "SyncError.hpp"

namespace jm {
const string TerminalFrameCodec::SENTINEL = "PTC1";

TerminalFrame TerminalFrameCodec::decode(const string& raw,
                                         int64_t receivedAtMs) {
  TerminalFrame frame;
  frame.set_received_at_ms(receivedAtMs);
  const size_t headerLength = SENTINEL.size() + 2;
  if (raw.size() >= headerLength && raw.compare(0, SENTINEL.size(), SENTINEL) == 0) {
    size_t idLength = (size_t(uint8_t(raw[SENTINEL.size()])) << 8) |
                      size_t(uint8_t(raw[SENTINEL.size() + 1]));
    if (headerLength + idLength <= raw.size()) {
      frame.set_session_id(raw.substr(headerLength, idLength));
      frame.set_payload(raw.substr(headerLength + idLength));
      return frame;
    }
    LOG(WARNING) << "Truncated terminal frame header, treating as raw bytes";
  }
  frame.set_payload(raw);
  return frame;
}

string TerminalFrameCodec::encode(const string& sessionId,
                                  const string& payload) {
  if (sessionId.size() > 0xFFFF) {
    throw SyncError::invalidState("Session id too long for a frame header");
  }
  string s = SENTINEL;
  s.push_back(char((sessionId.size() >> 8) & 0xFF));
  s.push_back(char(sessionId.size() & 0xFF));
  s.append(sessionId);
  s.append(payload);
  return s;
}
}  // namespace jm
