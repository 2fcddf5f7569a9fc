#ifndef __TPOD_RING_BUFFER_H__
#define __TPOD_RING_BUFFER_H__

#include "Headers.hpp"

namespace tpod {
/** @brief Capacity of the pod's output backlog (4 MiB). */
const size_t BACKLOG_CAPACITY = 4 * 1024 * 1024;

/**
 * @brief Fixed-capacity circular byte store used as the output backlog.
 *
 * Bytes occupy [start, start + length) modulo the capacity. append() evicts
 * the oldest bytes to make room, appendNoDrop() refuses instead.
 */
class RingBuffer {
 public:
  explicit RingBuffer(size_t _capacity);

  size_t capacity() const { return buffer.size(); }
  size_t size() const { return length; }
  size_t available() const { return buffer.size() - length; }
  bool isFull() const { return length == buffer.size(); }
  bool empty() const { return length == 0; }

  /**
   * @brief Appends bytes, evicting the oldest data when there is not enough
   * room. Input at least as large as the capacity keeps only its tail.
   */
  void append(const char* data, size_t n);

  /**
   * @brief Appends bytes only if they fit without evicting anything.
   * @return false and leaves the buffer unchanged when n > available().
   */
  bool appendNoDrop(const char* data, size_t n);

  /**
   * @brief Copies up to n of the oldest bytes into dest without consuming
   * them.
   * @return Number of bytes copied.
   */
  size_t copyOut(char* dest, size_t n) const;

  /** @brief Returns all retained bytes, oldest first. */
  string toString() const;

  /** @brief Drops all retained bytes. */
  void clear() {
    start = 0;
    length = 0;
  }

 protected:
  void writeAt(size_t offset, const char* data, size_t n);

  vector<char> buffer;
  size_t start;
  size_t length;
};
}  // namespace tpod

#endif  // __TPOD_RING_BUFFER_H__
