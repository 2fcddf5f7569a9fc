#include "RingBuffer.hpp"

namespace tpod {
RingBuffer::RingBuffer(size_t _capacity)
    : buffer(_capacity), start(0), length(0) {}

void RingBuffer::writeAt(size_t offset, const char* data, size_t n) {
  size_t cap = buffer.size();
  size_t first = min(n, cap - offset);
  memcpy(&buffer[0] + offset, data, first);
  if (first < n) {
    memcpy(&buffer[0], data + first, n - first);
  }
}

void RingBuffer::append(const char* data, size_t n) {
  size_t cap = buffer.size();
  if (cap == 0 || n == 0) {
    return;
  }
  if (n >= cap) {
    memcpy(&buffer[0], data + (n - cap), cap);
    start = 0;
    length = cap;
    return;
  }
  if (length + n > cap) {
    size_t evict = length + n - cap;
    start = (start + evict) % cap;
    length -= evict;
  }
  writeAt((start + length) % cap, data, n);
  length += n;
}

bool RingBuffer::appendNoDrop(const char* data, size_t n) {
  size_t cap = buffer.size();
  if (cap == 0 || n > available()) {
    return false;
  }
  if (n == 0) {
    return true;
  }
  writeAt((start + length) % cap, data, n);
  length += n;
  return true;
}

size_t RingBuffer::copyOut(char* dest, size_t n) const {
  size_t count = min(n, length);
  if (count == 0) {
    return 0;
  }
  size_t cap = buffer.size();
  size_t first = min(count, cap - start);
  memcpy(dest, &buffer[0] + start, first);
  if (first < count) {
    memcpy(dest + first, &buffer[0], count - first);
  }
  return count;
}

string RingBuffer::toString() const {
  string s(length, '\0');
  if (length) {
    copyOut(&s[0], length);
  }
  return s;
}
}  // namespace tpod
