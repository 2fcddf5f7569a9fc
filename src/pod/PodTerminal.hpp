#ifndef __TPOD_POD_TERMINAL_HPP__
#define __TPOD_POD_TERMINAL_HPP__

#include "Headers.hpp"

namespace tpod {
/**
 * @brief Abstract terminal owned by a pod: a child process attached to a
 * descriptor that can be read, written, resized and observed.
 */
class PodTerminal {
 public:
  virtual ~PodTerminal() {}

  /**
   * @brief Starts the child process.
   * @param shell Command to run. Commands containing a space are run through
   * /bin/sh -c.
   * @param cwd Working directory for the child, ignored when empty.
   * @param extraEnv Variables added to the child's environment.
   * @returns File descriptor used for reading output (typically a master
   * pty).
   */
  virtual int setup(const string& shell, const string& cwd,
                    const map<string, string>& extraEnv) = 0;
  /** @brief Returns the descriptor that can be polled for terminal output. */
  virtual int getFd() = 0;
  /** @brief Returns the child process id. */
  virtual pid_t getPid() = 0;
  /**
   * @brief Reads available output. Behaves like ::read, errno is preserved.
   */
  virtual ssize_t read(char* buf, size_t count) = 0;
  /**
   * @brief Writes as much of the buffer as the terminal takes without
   * blocking. Behaves like ::write, errno is preserved.
   */
  virtual ssize_t write(const char* buf, size_t count) = 0;
  /** @brief Applies a new window geometry to the running terminal. */
  virtual void setSize(uint16_t cols, uint16_t rows) = 0;
  /** @brief Returns true once the child has exited. Never blocks. */
  virtual bool pollExited() = 0;
  /** @brief Closes the terminal and reaps the child. Safe to call twice. */
  virtual void cleanup() = 0;
};
}  // namespace tpod

#endif  // __TPOD_POD_TERMINAL_HPP__
