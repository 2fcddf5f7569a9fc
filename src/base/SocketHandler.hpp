#ifndef __TPOD_SOCKET_HANDLER__
#define __TPOD_SOCKET_HANDLER__

#include "Frame.hpp"
#include "Headers.hpp"

namespace tpod {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Waits up to the given number of milliseconds for fd to become
   * readable.
   */
  virtual bool waitForData(int fd, int timeoutMs) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Writes a complete frame (header then payload).
   * @throws std::runtime_error on oversize payloads or any write failure.
   */
  inline void writeFrame(int fd, const Frame& frame) {
    if (frame.getPayload().length() > MAX_FRAME_LEN) {
      throw std::runtime_error("Frame payload exceeds the maximum length: " +
                               to_string(frame.getPayload().length()));
    }
    string s = frame.serialize();
    writeAllOrThrow(fd, &s[0], s.length(), true);
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   * @return The new non-blocking fd, or -1 with errno set when nothing was
   * accepted. Running out of descriptors (EMFILE, ENFILE) is reported this
   * way too.
   * @throws std::runtime_error on any other accept failure.
   */
  virtual int accept(int fd) = 0;
  /** @brief Toggles blocking mode on a descriptor. */
  virtual void setBlocking(int fd, bool blocking) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace tpod

#endif  // __TPOD_SOCKET_HANDLER__
