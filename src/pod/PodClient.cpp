#include "PodClient.hpp"

#include "PodMetadata.hpp"

namespace tpod {
namespace {
const size_t CLIENT_READ_SIZE = 64 * 1024;
const int ATTACH_POLL_MS = 250;

uint8_t controlCode(char c) {
  if (c >= 'a' && c <= 'z') {
    return uint8_t(c - 'a' + 1);
  }
  if (c >= 'A' && c <= 'Z') {
    return uint8_t(c - 'A' + 1);
  }
  return 0;
}
}  // namespace

DetachFilter::DetachFilter(char detachKey) : sawPrefix(false) {
  prefixCode = controlCode(detachKey);
  if (prefixCode == 0) {
    prefixCode = controlCode('b');
  }
}

bool DetachFilter::filter(const char* data, size_t n, string* forward) {
  for (size_t i = 0; i < n; i++) {
    char c = data[i];
    if (sawPrefix) {
      sawPrefix = false;
      if (c == 'd' || c == 'D') {
        return true;
      }
      forward->push_back(char(prefixCode));
      forward->push_back(c);
    } else if (uint8_t(c) == prefixCode) {
      sawPrefix = true;
    } else {
      forward->push_back(c);
    }
  }
  return false;
}

PodClient::PodClient(shared_ptr<SocketHandler> _socketHandler,
                     const string& _socketPath)
    : socketHandler(_socketHandler),
      socketPath(_socketPath),
      fd(-1),
      readBuffer(CLIENT_READ_SIZE) {}

PodClient::~PodClient() { close(); }

bool PodClient::connect() {
  SocketEndpoint endpoint;
  endpoint.set_name(socketPath);
  fd = socketHandler->connect(endpoint);
  if (fd < 0) {
    VLOG(1) << "Could not connect to " << socketPath << ": "
            << strerror(GetErrno());
    return false;
  }
  reader.reset();
  return true;
}

void PodClient::close() {
  if (fd >= 0) {
    socketHandler->close(fd);
    fd = -1;
  }
}

void PodClient::sendInput(const string& data) {
  socketHandler->writeFrame(fd, Frame(FRAME_INPUT, data));
}

void PodClient::sendResize(uint16_t cols, uint16_t rows) {
  socketHandler->writeFrame(fd, Frame::resize(cols, rows));
}

bool PodClient::readAvailable(vector<Frame>* frames) {
  ssize_t n = socketHandler->read(fd, &readBuffer[0], readBuffer.size());
  if (n == 0) {
    return false;
  }
  if (n < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return true;
    }
    throw std::runtime_error(string("Error reading from pod: ") +
                             strerror(localErrno));
  }
  vector<Frame> newFrames = reader.feed(&readBuffer[0], size_t(n));
  frames->insert(frames->end(), newFrames.begin(), newFrames.end());
  return true;
}

vector<Frame> PodClient::readFrames(int timeoutMs) {
  vector<Frame> frames;
  if (!socketHandler->waitForData(fd, timeoutMs)) {
    return frames;
  }
  if (!readAvailable(&frames)) {
    throw std::runtime_error("Pod closed the connection");
  }
  return frames;
}

void PodClient::sendConsoleSize(shared_ptr<Console> console) {
  TerminalInfo ti = console->getTerminalInfo();
  sendResize(uint16_t(ti.column()), uint16_t(ti.row()));
}

bool PodClient::attach(shared_ptr<Console> console, char detachKey,
                       int winchFd) {
  DetachFilter detachFilter(detachKey);
  sendConsoleSize(console);

  while (true) {
    pollfd fds[3];
    fds[0].fd = console->getInputFd();
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = fd;
    fds[1].events = POLLIN | POLLHUP | POLLERR;
    fds[1].revents = 0;
    fds[2].fd = winchFd;
    fds[2].events = POLLIN;
    fds[2].revents = 0;

    int rc = ::poll(fds, 3, ATTACH_POLL_MS);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      throw std::runtime_error(string("poll failed: ") +
                               strerror(GetErrno()));
    }
    if (rc == 0) {
      continue;
    }

    if (winchFd >= 0 && (fds[2].revents & POLLIN)) {
      char drain[64];
      while (::read(winchFd, drain, sizeof(drain)) > 0) {
      }
      sendConsoleSize(console);
    }

    if (fds[1].revents & POLLIN) {
      vector<Frame> frames;
      if (!readAvailable(&frames)) {
        LOG(INFO) << "Pod closed the connection";
        return false;
      }
      for (const auto& frame : frames) {
        if (frame.getHeader() == FRAME_OUTPUT) {
          console->write(frame.getPayload());
        } else if (frame.getHeader() == FRAME_BACKLOG_END) {
          VLOG(1) << "Backlog replay finished";
        }
      }
    } else if (fds[1].revents & (POLLHUP | POLLERR)) {
      LOG(INFO) << "Pod hung up";
      return false;
    }

    if (fds[0].revents & POLLIN) {
      char buf[4096];
      ssize_t n = ::read(console->getInputFd(), buf, sizeof(buf));
      if (n == 0) {
        LOG(INFO) << "Console input closed";
        return true;
      }
      if (n < 0) {
        auto localErrno = GetErrno();
        if (localErrno == EAGAIN || localErrno == EINTR) {
          continue;
        }
        throw std::runtime_error(string("Error reading console: ") +
                                 strerror(localErrno));
      }
      string forward;
      bool detached = detachFilter.filter(buf, size_t(n), &forward);
      if (!forward.empty()) {
        sendInput(forward);
      }
      if (detached) {
        return true;
      }
    } else if (fds[0].revents & (POLLHUP | POLLERR)) {
      return true;
    }
  }
}

string PodClient::resolveSocket(const string& socket, const string& uuid,
                                const string& name,
                                const PodSocketPath& paths) {
  if (!socket.empty()) {
    return socket;
  }
  if (!uuid.empty()) {
    if (!PodMetadata::isValidUuid(uuid)) {
      throw std::runtime_error("--uuid must be " + to_string(UUID_LENGTH) +
                               " characters");
    }
    return paths.getSocketPath(uuid);
  }
  if (!name.empty()) {
    auto info = PodMetadata::findNewestByName(paths.getDirectory(), name);
    if (info) {
      return paths.getSocketPath(info->uuid());
    }
    return paths.getAliasPath(name);
  }
  throw std::runtime_error("must provide --socket, --uuid, or --name");
}

string PodClient::buildSendPayload(const string& text, const string& ctrl,
                                   bool enter) {
  string payload;
  if (!ctrl.empty()) {
    if (ctrl.length() != 1 || controlCode(ctrl[0]) == 0) {
      throw std::runtime_error("--ctrl requires a single letter (a-z)");
    }
    payload.push_back(char(controlCode(ctrl[0])));
  } else {
    payload = text;
  }
  if (enter) {
    payload.push_back('\n');
  }
  if (payload.empty()) {
    throw std::runtime_error(
        "no data to send (use a text argument, --ctrl, or --enter)");
  }
  if (payload.length() > MAX_FRAME_LEN) {
    throw std::runtime_error("text too long");
  }
  return payload;
}
}  // namespace tpod
