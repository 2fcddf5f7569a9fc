#include "RawSocketUtils.hpp"

namespace tpod {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      LOG(WARNING) << "Cannot write to raw fd: " << strerror(localErrno);
      throw std::runtime_error("Cannot write to raw fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to raw fd: fd closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void RawSocketUtils::readAll(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesRead = 0;
  do {
    if (!waitOnSocketData(fd)) {
      continue;
    }
    ssize_t rc = ::read(fd, buf + bytesRead, count - bytesRead);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        continue;
      }
      LOG(WARNING) << "Cannot read from raw fd: " << strerror(localErrno);
      throw std::runtime_error("Cannot read from raw fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Fd has closed abruptly.");
    }
    bytesRead += rc;
  } while (bytesRead != count);
}
}  // namespace tpod
