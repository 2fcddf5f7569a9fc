#ifndef __TPOD_POD_CLIENT_H__
#define __TPOD_POD_CLIENT_H__

#include "Console.hpp"
#include "FrameReader.hpp"
#include "Headers.hpp"
#include "PodSocketPath.hpp"
#include "SocketHandler.hpp"

namespace tpod {
/**
 * @brief Watches keystrokes for the detach sequence: Ctrl+<key> followed by
 * 'd'. The prefix followed by anything else is passed through untouched.
 */
class DetachFilter {
 public:
  explicit DetachFilter(char detachKey);

  /**
   * @brief Filters a chunk of keystrokes.
   * @param forward Receives the bytes that should be sent to the pod.
   * @return true once the detach sequence has been typed. Bytes after the
   * sequence are discarded.
   */
  bool filter(const char* data, size_t n, string* forward);

  uint8_t getPrefixCode() const { return prefixCode; }
  bool hasPendingPrefix() const { return sawPrefix; }

 protected:
  uint8_t prefixCode;
  bool sawPrefix;
};

/**
 * @brief Client side of a pod connection, used by tpod-send and tpod-attach.
 *
 * Connecting while no primary client is attached makes this client the
 * primary one, which means it receives the backlog replay.
 */
class PodClient {
 public:
  PodClient(shared_ptr<SocketHandler> _socketHandler,
            const string& _socketPath);
  virtual ~PodClient();

  /** @return false when nothing is listening on the socket. */
  bool connect();
  void close();
  inline int getFd() const { return fd; }

  /** @throws std::runtime_error when the connection is lost. */
  void sendInput(const string& data);
  /** @throws std::runtime_error when the connection is lost. */
  void sendResize(uint16_t cols, uint16_t rows);

  /**
   * @brief Waits up to timeoutMs for data and returns the frames it
   * completes.
   * @throws std::runtime_error when the pod closed the connection.
   */
  vector<Frame> readFrames(int timeoutMs);

  /**
   * @brief Proxies the console to the pod until the user detaches or the pod
   * goes away.
   * @param winchFd Read end of a pipe that becomes readable when the console
   * is resized, or -1.
   * @return true when the user detached, false when the pod closed the
   * connection.
   */
  bool attach(shared_ptr<Console> console, char detachKey, int winchFd);

  /**
   * @brief Picks the socket to connect to: an explicit path, the socket of a
   * pane uuid, or the newest pod with the given name (falling back to its
   * alias).
   * @throws std::runtime_error when no usable target was given.
   */
  static string resolveSocket(const string& socket, const string& uuid,
                              const string& name, const PodSocketPath& paths);

  /**
   * @brief Builds the bytes tpod-send writes. `ctrl` is a single letter sent
   * as its control code and takes precedence over `text`. `enter` appends a
   * newline.
   * @throws std::runtime_error on an invalid ctrl letter or empty payload.
   */
  static string buildSendPayload(const string& text, const string& ctrl,
                                 bool enter);

 protected:
  /** @return false when the pod closed the connection. */
  bool readAvailable(vector<Frame>* frames);
  void sendConsoleSize(shared_ptr<Console> console);

  shared_ptr<SocketHandler> socketHandler;
  string socketPath;
  int fd;
  FrameReader reader;
  vector<char> readBuffer;
};
}  // namespace tpod

#endif  // __TPOD_POD_CLIENT_H__
