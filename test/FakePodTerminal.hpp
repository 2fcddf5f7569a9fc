#ifndef __TPOD_FAKE_POD_TERMINAL_HPP__
#define __TPOD_FAKE_POD_TERMINAL_HPP__

#include "PodTerminal.hpp"
#include "RawSocketUtils.hpp"

namespace tpod {
/**
 * @brief PodTerminal backed by a socketpair. The test plays the child
 * process on the other end.
 */
class FakePodTerminal : public PodTerminal {
 public:
  FakePodTerminal()
      : exited(false),
        cleanupCount(0),
        lastCols(0),
        lastRows(0),
        ptyFd(-1),
        childFd(-1) {}

  virtual ~FakePodTerminal() {
    closeFd(&ptyFd);
    closeFd(&childFd);
  }

  virtual int setup(const string& shell, const string& cwd,
                    const map<string, string>& extraEnv) {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    ptyFd = fds[0];
    childFd = fds[1];
    int opts = fcntl(ptyFd, F_GETFL);
    FATAL_FAIL(opts);
    FATAL_FAIL(fcntl(ptyFd, F_SETFL, opts | O_NONBLOCK));
    return ptyFd;
  }

  virtual int getFd() { return ptyFd; }
  virtual pid_t getPid() { return 4242; }

  virtual ssize_t read(char* buf, size_t count) {
    return ::read(ptyFd, buf, count);
  }

  virtual ssize_t write(const char* buf, size_t count) {
    return ::send(ptyFd, buf, count, MSG_NOSIGNAL);
  }

  virtual void setSize(uint16_t cols, uint16_t rows) {
    lastCols = cols;
    lastRows = rows;
  }

  virtual bool pollExited() { return exited; }

  virtual void cleanup() {
    cleanupCount++;
    closeFd(&ptyFd);
  }

  /** @brief Writes bytes as if the child printed them. */
  void simulateOutput(const string& s) {
    RawSocketUtils::writeAll(childFd, s.c_str(), s.length());
  }

  /** @brief Reads exactly count bytes that were typed into the terminal. */
  string getKeystrokes(size_t count) {
    string s(count, '\0');
    RawSocketUtils::readAll(childFd, &s[0], count);
    return s;
  }

  /** @brief Returns whatever was typed so far without waiting. */
  string drainKeystrokes() {
    string s(64 * 1024, '\0');
    ssize_t n = ::recv(childFd, &s[0], s.length(), MSG_DONTWAIT);
    return n > 0 ? s.substr(0, n) : string();
  }

  /** @brief Closes the child side, like a shell exiting. */
  void hangup() { closeFd(&childFd); }

  bool exited;
  int cleanupCount;
  uint16_t lastCols;
  uint16_t lastRows;

 protected:
  static void closeFd(int* fd) {
    if (*fd >= 0) {
      ::close(*fd);
      *fd = -1;
    }
  }

  int ptyFd;
  int childFd;
};
}  // namespace tpod

#endif  // __TPOD_FAKE_POD_TERMINAL_HPP__
