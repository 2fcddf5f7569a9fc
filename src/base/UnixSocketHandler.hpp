#ifndef __TPOD_UNIX_SOCKET_HANDLER__
#define __TPOD_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace tpod {
/**
 * @brief Default SocketHandler implementation using POSIX sockets. The pod is
 * single threaded so descriptors are only tracked, not locked.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with poll() until the fd becomes readable or the timeout
   * expires.
   */
  virtual bool waitForData(int fd, int timeoutMs);
  /** @brief Reads up to `count` bytes, preserving errno on failure. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes by retrying until completion or timeout. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /**
   * @brief Accepts a pending connection on the provided listening socket.
   */
  virtual int accept(int fd);
  /** @brief Toggles blocking mode on a descriptor. */
  virtual void setBlocking(int fd, bool blocking);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);

 protected:
  /**
   * @brief Starts tracking a descriptor.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, signal handling).
   */
  virtual void initSocket(int fd);
  /**
   * @brief Adds reusable flags for listening sockets.
   */
  virtual void initServerSocket(int fd);

  set<int> activeSockets;
};
}  // namespace tpod

#endif  // __TPOD_UNIX_SOCKET_HANDLER__
