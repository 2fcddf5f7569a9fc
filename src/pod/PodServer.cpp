#include "PodServer.hpp"

namespace tpod {
namespace {
const char SCROLLBACK_CLEAR[] = "\x1b[3J";
const int SIDE_CHANNEL_WAIT_MS = 100;
const int POLL_TIMEOUT_MS = 1000;
const int ACCEPT_BACKOFF_MS = 100;

bool isTransient(int e) {
  return e == EAGAIN || e == EWOULDBLOCK || e == EINTR;
}
}  // namespace

bool containsClearSignal(const char* data, size_t n) {
  if (n == 0) {
    return false;
  }
  if (memchr(data, 0x0C, n) != NULL) {
    return true;
  }
  const char* end = data + n;
  const char* seqEnd = SCROLLBACK_CLEAR + strlen(SCROLLBACK_CLEAR);
  return std::search(data, end, SCROLLBACK_CLEAR, seqEnd) != end;
}

PodServer::PodServer(shared_ptr<SocketHandler> _socketHandler,
                     const SocketEndpoint& _endpoint,
                     shared_ptr<PodTerminal> _terminal, const string& _uuid,
                     size_t backlogCapacity)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      terminal(_terminal),
      uuid(_uuid),
      serverFd(-1),
      clientFd(-1),
      backlog(backlogCapacity),
      ptyPaused(false),
      readBuffer(MAX_FRAME_LEN) {
  serverFd = *(socketHandler->listen(endpoint).begin());
  LOG(INFO) << "Pod " << uuid << " listening on " << endpoint;
}

PodServer::~PodServer() {
  if (clientFd >= 0) {
    socketHandler->close(clientFd);
    clientFd = -1;
  }
  socketHandler->stopListening(endpoint);
  terminal->cleanup();
}

void PodServer::run() {
  while (iterate(POLL_TIMEOUT_MS)) {
  }
  LOG(INFO) << "Pod " << uuid << " session ended";
}

bool PodServer::iterate(int timeoutMs) {
  if (terminal->pollExited()) {
    LOG(INFO) << "Child process exited";
    return false;
  }
  if (clientFd < 0 && backlog.isFull()) {
    ptyPaused = true;
  }
  const bool acceptPaused =
      std::chrono::steady_clock::now() < acceptPausedUntil;
  if (acceptPaused && (timeoutMs < 0 || timeoutMs > ACCEPT_BACKOFF_MS)) {
    timeoutMs = ACCEPT_BACKOFF_MS;
  }

  const int polledClientFd = clientFd;
  pollfd fds[3];
  nfds_t nfds = 2;
  fds[0].fd = serverFd;
  fds[0].events = acceptPaused ? 0 : POLLIN;
  fds[0].revents = 0;
  fds[1].fd = terminal->getFd();
  fds[1].events = POLLHUP | POLLERR;
  if (!ptyPaused) {
    fds[1].events |= POLLIN;
  }
  if (!pendingInput.empty()) {
    fds[1].events |= POLLOUT;
  }
  fds[1].revents = 0;
  if (polledClientFd >= 0) {
    fds[2].fd = polledClientFd;
    fds[2].events = POLLHUP | POLLERR;
    if (pendingInput.empty()) {
      fds[2].events |= POLLIN;
    }
    fds[2].revents = 0;
    nfds = 3;
  }

  int rc = ::poll(fds, nfds, timeoutMs);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      return true;
    }
    throw std::runtime_error(string("poll failed: ") + strerror(localErrno));
  }
  if (rc == 0) {
    return true;
  }

  if (fds[0].revents & POLLIN) {
    pollAccept();
  }

  if (fds[1].revents & (POLLHUP | POLLERR)) {
    LOG(INFO) << "Pty hung up";
    return false;
  }
  if (fds[1].revents & POLLIN) {
    if (!handlePtyOutput()) {
      return false;
    }
  }
  if (fds[1].revents & POLLOUT) {
    flushInput();
  }

  if (polledClientFd >= 0 && clientFd == polledClientFd) {
    if (fds[2].revents & (POLLHUP | POLLERR)) {
      LOG(INFO) << "Client hung up";
      dropClient();
    } else if (fds[2].revents & POLLIN) {
      handleClientInput();
    }
  }
  return true;
}

void PodServer::pollAccept() {
  int fd = socketHandler->accept(serverFd);
  if (fd < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EMFILE || localErrno == ENFILE) {
      // The connection stays queued until descriptors free up.
      acceptPausedUntil = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(ACCEPT_BACKOFF_MS);
    }
    return;
  }
  if (clientFd < 0) {
    attachClient(fd);
  } else {
    handleSideChannel(fd);
  }
}

void PodServer::attachClient(int fd) {
  char peek;
  if (::recv(fd, &peek, 1, MSG_PEEK | MSG_DONTWAIT) == 0) {
    VLOG(1) << "Client " << fd << " hung up before the replay";
    socketHandler->close(fd);
    return;
  }
  LOG(INFO) << "Attaching client " << fd << ", replaying " << backlog.size()
            << " bytes";
  socketHandler->setBlocking(fd, true);
  clientFd = fd;
  clientReader.reset();
  try {
    string pending = backlog.toString();
    for (size_t pos = 0; pos < pending.length(); pos += REPLAY_CHUNK_SIZE) {
      socketHandler->writeFrame(
          fd, Frame(FRAME_OUTPUT, pending.substr(pos, REPLAY_CHUNK_SIZE)));
    }
    socketHandler->writeFrame(fd, Frame(FRAME_BACKLOG_END, ""));
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Backlog replay failed: " << re.what();
    dropClient();
    return;
  }
  backlog.clear();
  ptyPaused = false;
}

void PodServer::handleSideChannel(int fd) {
  VLOG(1) << "Side channel connection " << fd;
  sideReader.reset();
  if (socketHandler->waitForData(fd, SIDE_CHANNEL_WAIT_MS)) {
    ssize_t n = socketHandler->read(fd, &readBuffer[0], readBuffer.size());
    if (n > 0) {
      vector<Frame> frames = sideReader.feed(&readBuffer[0], size_t(n));
      for (const auto& frame : frames) {
        dispatch(frame);
      }
    } else if (n < 0) {
      VLOG(1) << "Side channel read failed: " << strerror(GetErrno());
    }
  }
  socketHandler->close(fd);
}

ssize_t PodServer::readPty(size_t count) {
  ssize_t n = terminal->read(&readBuffer[0], count);
  if (n == 0) {
    LOG(INFO) << "Pty reached EOF";
    return -1;
  }
  if (n < 0) {
    auto localErrno = GetErrno();
    if (isTransient(localErrno)) {
      return 0;
    }
    if (localErrno == EIO) {
      // Linux reports a hung up slave as EIO.
      LOG(INFO) << "Pty closed";
      return -1;
    }
    throw std::runtime_error(string("Error reading from pty: ") +
                             strerror(localErrno));
  }
  return n;
}

bool PodServer::handlePtyOutput() {
  size_t toRead = readBuffer.size();
  if (clientFd < 0) {
    if (backlog.available() == 0) {
      ptyPaused = true;
      return true;
    }
    toRead = min(backlog.available(), toRead);
  }

  ssize_t n = readPty(toRead);
  if (n < 0) {
    return false;
  }
  if (n == 0) {
    return true;
  }
  if (containsClearSignal(&readBuffer[0], size_t(n))) {
    VLOG(2) << "Clear signal, dropping backlog";
    backlog.clear();
  }

  if (clientFd < 0) {
    if (!backlog.appendNoDrop(&readBuffer[0], size_t(n)) ||
        backlog.isFull()) {
      VLOG(1) << "Backlog full, pausing pty";
      ptyPaused = true;
    }
    return true;
  }

  backlog.append(&readBuffer[0], size_t(n));
  try {
    socketHandler->writeFrame(clientFd,
                              Frame(FRAME_OUTPUT, string(&readBuffer[0], n)));
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Lost client while forwarding output: " << re.what();
    dropClient();
  }
  return true;
}

void PodServer::handleClientInput() {
  ssize_t n = socketHandler->read(clientFd, &readBuffer[0], readBuffer.size());
  if (n == 0) {
    LOG(INFO) << "Client disconnected";
    dropClient();
    return;
  }
  if (n < 0) {
    auto localErrno = GetErrno();
    if (isTransient(localErrno)) {
      return;
    }
    LOG(INFO) << "Error reading from client: " << strerror(localErrno);
    dropClient();
    return;
  }
  vector<Frame> frames = clientReader.feed(&readBuffer[0], size_t(n));
  for (const auto& frame : frames) {
    dispatch(frame);
  }
}

void PodServer::dispatch(const Frame& frame) {
  switch (frame.getHeader()) {
    case FRAME_INPUT: {
      queueInput(frame.getPayload());
      break;
    }
    case FRAME_RESIZE: {
      uint16_t cols, rows;
      if (frame.parseResize(&cols, &rows)) {
        VLOG(1) << "Resizing pty to " << cols << "x" << rows;
        terminal->setSize(cols, rows);
      }
      break;
    }
    default: {
      VLOG(2) << "Ignoring frame of type " << int(frame.getHeader());
      break;
    }
  }
}

void PodServer::queueInput(const string& data) {
  if (pendingInput.length() + data.length() > MAX_PENDING_INPUT) {
    LOG(WARNING) << "Pty is not taking input, dropping " << data.length()
                 << " bytes";
    return;
  }
  pendingInput.append(data);
  flushInput();
}

void PodServer::flushInput() {
  while (!pendingInput.empty()) {
    ssize_t n = terminal->write(pendingInput.data(), pendingInput.length());
    if (n < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        VLOG(2) << pendingInput.length() << " bytes waiting for the pty";
        return;
      }
      LOG(WARNING) << "Error writing to pty, dropping " << pendingInput.length()
                   << " bytes of input: " << strerror(localErrno);
      pendingInput.clear();
      return;
    }
    if (n == 0) {
      return;
    }
    pendingInput.erase(0, size_t(n));
  }
}

void PodServer::dropClient() {
  if (clientFd < 0) {
    return;
  }
  LOG(INFO) << "Dropping client " << clientFd;
  socketHandler->close(clientFd);
  clientFd = -1;
  clientReader.reset();
}
}  // namespace tpod
