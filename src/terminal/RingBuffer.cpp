#include "RingBuffer.hpp"

namespace jm {
RingBuffer::RingBuffer(size_t _maxBytes) : maxBytes(_maxBytes) {
  if (maxBytes == 0) {
    STFATAL << "RingBuffer needs a positive capacity";
  }
}

void RingBuffer::append(const string& bytes) {
  data.append(bytes);
  if (data.size() > maxBytes) {
    data.erase(0, data.size() - maxBytes);
  }
}
}  // namespace jm
