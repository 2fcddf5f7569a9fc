#ifndef __TPOD_RAW_SOCKET_UTILS__
#define __TPOD_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace tpod {
/**
 * @brief Simple blocking wrappers around POSIX read/write loops.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads exactly `count` bytes from the descriptor, waiting for data.
   */
  static void readAll(int fd, char* buf, size_t count);
};
}  // namespace tpod
#endif  // __TPOD_RAW_SOCKET_UTILS__
