#include "PipeSocketHandler.hpp"

namespace tpod {
PipeSocketHandler::PipeSocketHandler() {}

void PipeSocketHandler::fillAddress(const string& pipePath,
                                    sockaddr_un* addr) {
  memset(addr, 0, sizeof(sockaddr_un));
  addr->sun_family = AF_UNIX;
  if (pipePath.empty() || pipePath.length() >= sizeof(addr->sun_path)) {
    throw runtime_error("Invalid unix socket path: " + pipePath);
  }
  strncpy(addr->sun_path, pipePath.c_str(), sizeof(addr->sun_path) - 1);
}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  string pipePath = endpoint.name();
  sockaddr_un remote;
  fillAddress(pipePath, &remote);

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS && localErrno != EAGAIN) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    ::shutdown(sockFd, SHUT_RDWR);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  if (result < 0) {
    pollfd pfd;
    pfd.fd = sockFd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    VLOG(4) << "Before polling sockFd";
    int ready = ::poll(&pfd, 1, 3000);
    int so_error = ETIMEDOUT;
    if (ready > 0) {
      socklen_t len = sizeof so_error;
      FATAL_FAIL(
          ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len));
    }
    if (so_error != 0) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error
                << " " << strerror(so_error);
      FATAL_FAIL(::close(sockFd));
      SetErrno(so_error);
      return -1;
    }
  }

  LOG(INFO) << "Connected to endpoint " << endpoint;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  fillAddress(pipePath, &local);

  fs::path parent = fs::path(pipePath).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      throw runtime_error("Could not create socket directory " +
                          parent.string() + ": " + ec.message());
    }
  }
  // Remove a stale socket left behind by a previous pod.
  unlink(local.sun_path);

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) < 0) {
    auto localErrno = GetErrno();
    ::close(fd);
    throw runtime_error("Could not bind " + pipePath + ": " +
                        strerror(localErrno));
  }
  FATAL_FAIL(::listen(fd, 16));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  LOG(INFO) << "Listening on " << endpoint << " with fd " << fd;
  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a path that we weren't listening on:"
            << pipePath;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  ::unlink(pipePath.c_str());
}
}  // namespace tpod
