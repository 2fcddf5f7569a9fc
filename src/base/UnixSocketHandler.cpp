#include "UnixSocketHandler.hpp"

namespace tpod {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int n = ::poll(&pfd, 1, timeoutMs);
  if (n <= 0) {
    // Timed out or interrupted.
    VLOG(4) << "socket poll timeout";
    return false;
  }
  VLOG(4) << "socket " << fd << " has data";
  return (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  if (activeSockets.find(fd) == activeSockets.end()) {
    LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
      localErrno != EINTR) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  if (activeSockets.find(fd) == activeSockets.end()) {
    LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  // Try to write for around 5 seconds before giving up
  time_t startTime = time(NULL);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t w;
#ifdef MSG_NOSIGNAL
    w = ::send(fd, ((const char *)buf) + bytesWritten, count - bytesWritten,
               MSG_NOSIGNAL);
#else
    w = ::write(fd, ((const char *)buf) + bytesWritten, count - bytesWritten);
#endif
    if (w < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (time(NULL) > startTime + 5) {
          // Give up
          errno = ETIMEDOUT;
          return -1;
        }
      } else {
        return -1;
      }
    } else {
      bytesWritten += w;
    }
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  if (activeSockets.find(fd) != activeSockets.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSockets.insert(fd);
}

int UnixSocketHandler::accept(int sockFd) {
  sockaddr_un client;
  socklen_t c = sizeof(sockaddr_un);
  int client_sock = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = errno;
  VLOG(3) << "Socket " << sockFd
          << " accepted, returned client_sock: " << client_sock;
  if (client_sock >= 0) {
    addToActiveSockets(client_sock);
    initSocket(client_sock);
    return client_sock;
  } else if (acceptErrno == EMFILE || acceptErrno == ENFILE) {
    LOG(WARNING) << "Out of descriptors, cannot accept on " << sockFd << ": "
                 << strerror(acceptErrno);
  } else if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
             acceptErrno != ECONNABORTED && acceptErrno != EINTR) {
    LOG(ERROR) << "Error accepting on " << sockFd << ": "
               << strerror(acceptErrno);
    throw std::runtime_error(string("accept failed: ") +
                             strerror(acceptErrno));
  }

  errno = acceptErrno;
  return -1;
}

void UnixSocketHandler::setBlocking(int fd, bool blocking) {
  int opts;
  opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  if (blocking) {
    opts &= ~O_NONBLOCK;
  } else {
    opts |= O_NONBLOCK;
  }
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  auto it = activeSockets.find(fd);
  if (it == activeSockets.end()) {
    // Connection was already killed.
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSockets.erase(it);
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  // Sockets start out non-blocking
  {
    int opts;
    opts = fcntl(fd, F_GETFL);
    FATAL_FAIL_UNLESS_EINVAL(opts);
    opts |= O_NONBLOCK;
    FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
  }
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  // Also set the accept socket as reusable
  {
    int flag = 1;
    FATAL_FAIL(
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
  }
}
}  // namespace tpod
