#ifndef __TPOD_FAKE_CONSOLE_HPP__
#define __TPOD_FAKE_CONSOLE_HPP__

#include <functional>

#include "Console.hpp"

namespace tpod {
/**
 * @brief Console whose keystrokes come from a pipe the test writes to. Output
 * is captured in memory.
 */
class FakeConsole : public Console {
 public:
  FakeConsole() : setupCount(0), teardownCount(0) {
    inputPipe[0] = inputPipe[1] = -1;
  }

  virtual ~FakeConsole() {
    for (int fd : inputPipe) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }

  virtual void setup() {
    setupCount++;
    FATAL_FAIL(::pipe(inputPipe));
    int opts = fcntl(inputPipe[0], F_GETFL);
    FATAL_FAIL(opts);
    FATAL_FAIL(fcntl(inputPipe[0], F_SETFL, opts | O_NONBLOCK));
    terminalInfo.set_row(24);
    terminalInfo.set_column(100);
  }

  virtual void teardown() { teardownCount++; }

  virtual TerminalInfo getTerminalInfo() { return terminalInfo; }

  // Output never reaches a descriptor.
  virtual int getFd() { return -1; }
  virtual int getInputFd() { return inputPipe[0]; }

  virtual void write(const string& s) {
    output += s;
    if (onOutput) {
      onOutput(output);
    }
  }

  void typeKeys(const string& keys) {
    RawSocketUtils::writeAll(inputPipe[1], keys.c_str(), keys.length());
  }

  string output;
  std::function<void(const string&)> onOutput;
  TerminalInfo terminalInfo;
  int setupCount;
  int teardownCount;

 protected:
  int inputPipe[2];
};
}  // namespace tpod

#endif  // __TPOD_FAKE_CONSOLE_HPP__
