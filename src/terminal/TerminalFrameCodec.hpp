#ifndef __JM_TERMINAL_FRAME_CODEC__
#define __JM_TERMINAL_FRAME_CODEC__

#include "Headers.hpp"

namespace jm {
/**
 * @brief Splits the session header off binary terminal frames.
 *
 * A framed chunk is `PTC1`, a big-endian 16-bit session id length, the
 * session id, then the payload.  Anything else is an untagged payload.
 */
class TerminalFrameCodec {
 public:
  static const string SENTINEL;

  static TerminalFrame decode(const string& raw, int64_t receivedAtMs);

  static string encode(const string& sessionId, const string& payload);
};
}  // namespace jm

#endif  // __JM_TERMINAL_FRAME_CODEC__
