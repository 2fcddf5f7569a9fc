#ifndef __TPOD_PIPE_SOCKET_HANDLER__
#define __TPOD_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace tpod {
/**
 * @brief Handles UNIX domain socket connections addressed by filesystem path.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a socket identified by the endpoint name.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket and stores it internally.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the specified path, closes its fd and removes
   * the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Fills a sockaddr_un, throwing if the path does not fit. */
  static void fillAddress(const string& pipePath, sockaddr_un* addr);

  /** @brief Tracks path -> listening socket descriptors for each socket. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace tpod

#endif  // __TPOD_PIPE_SOCKET_HANDLER__
