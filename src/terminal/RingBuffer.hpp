#ifndef __JM_RING_BUFFER__
#define __JM_RING_BUFFER__

#include "Headers.hpp"

namespace jm {
/**
 * @brief Bounded byte log for one terminal session.
 *
 * Appending past `maxBytes` evicts exactly the overflow from the head.  Reads
 * never consume data.
 */
class RingBuffer {
 public:
  explicit RingBuffer(size_t _maxBytes = 2000000);

  void append(const string& bytes);

  /** @brief Current contents, oldest byte first. */
  string snapshot() const { return data; }

  size_t size() const { return data.size(); }
  size_t getMaxBytes() const { return maxBytes; }

 protected:
  string data;
  size_t maxBytes;
};
}  // namespace jm

#endif  // __JM_RING_BUFFER__
