#ifndef __TPOD_POD_SERVER_H__
#define __TPOD_POD_SERVER_H__

#include "FrameReader.hpp"
#include "Headers.hpp"
#include "PodTerminal.hpp"
#include "RingBuffer.hpp"
#include "SocketHandler.hpp"

namespace tpod {
/** @brief Largest output frame used when replaying the backlog (16 KiB). */
const size_t REPLAY_CHUNK_SIZE = 16 * 1024;
/** @brief Input waiting for the pty to become writable is capped here. */
const size_t MAX_PENDING_INPUT = 2 * MAX_FRAME_LEN;

/**
 * @brief Returns true when the chunk asks the terminal to clear its screen
 * (a form feed byte or the ESC [ 3 J scrollback erase sequence).
 */
bool containsClearSignal(const char* data, size_t n);

/**
 * @brief Single threaded event loop that bridges a pty to at most one primary
 * client over a unix socket.
 *
 * While no client is attached, output is kept in a backlog without dropping
 * anything. Once the backlog is full the pty stops being read so the child
 * blocks. Attaching a client replays and clears the backlog. Connections made
 * while a client is attached are treated as one-shot side-channel commands.
 *
 * Input is written to the pty without blocking. Whatever the pty does not take
 * is queued until it becomes writable, and the primary client is not read
 * while the queue is non-empty.
 */
class PodServer {
 public:
  /**
   * @brief Starts listening on the endpoint for the already started terminal.
   */
  PodServer(shared_ptr<SocketHandler> _socketHandler,
            const SocketEndpoint& _endpoint,
            shared_ptr<PodTerminal> _terminal, const string& _uuid,
            size_t backlogCapacity = BACKLOG_CAPACITY);
  /** @brief Closes the client, removes the socket and reaps the terminal. */
  virtual ~PodServer();

  /**
   * @brief Runs a single poll iteration.
   * @return false once the session is over (child exit, pty hangup or EOF).
   * @throws std::runtime_error on unexpected I/O failures.
   */
  bool iterate(int timeoutMs);

  /** @brief Loops until the session ends. */
  void run();

  inline bool hasClient() const { return clientFd >= 0; }
  inline int getClientFd() const { return clientFd; }
  inline bool isPtyPaused() const { return ptyPaused; }
  inline const RingBuffer& getBacklog() const { return backlog; }
  inline size_t getPendingInputSize() const { return pendingInput.length(); }

 protected:
  void pollAccept();
  /**
   * @brief Makes fd the primary client and replays the backlog to it. A peer
   * that already hung up without sending anything is closed instead.
   */
  void attachClient(int fd);
  /** @brief Serves one request on a short lived connection and closes it. */
  void handleSideChannel(int fd);
  /**
   * @brief Reads up to count bytes of pty output into readBuffer.
   * @return Bytes read, 0 when nothing was ready, -1 once the pty is gone.
   */
  ssize_t readPty(size_t count);
  /** @return false when the pty reached end of file. */
  bool handlePtyOutput();
  void handleClientInput();
  void dispatch(const Frame& frame);
  /** @brief Appends keystrokes for the pty and writes what it takes now. */
  void queueInput(const string& data);
  void flushInput();
  void dropClient();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<PodTerminal> terminal;
  string uuid;
  int serverFd;
  int clientFd;
  RingBuffer backlog;
  FrameReader clientReader;
  FrameReader sideReader;
  bool ptyPaused;
  string pendingInput;
  std::chrono::steady_clock::time_point acceptPausedUntil;
  vector<char> readBuffer;
};
}  // namespace tpod

#endif  // __TPOD_POD_SERVER_H__
