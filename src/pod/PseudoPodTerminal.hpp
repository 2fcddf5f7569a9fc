#ifndef __TPOD_PSEUDO_POD_TERMINAL_HPP__
#define __TPOD_PSEUDO_POD_TERMINAL_HPP__

#include "PodTerminal.hpp"

namespace tpod {
/**
 * @brief PodTerminal backed by forkpty().
 */
class PseudoPodTerminal : public PodTerminal {
 public:
  PseudoPodTerminal();
  virtual ~PseudoPodTerminal();

  virtual int setup(const string& shell, const string& cwd,
                    const map<string, string>& extraEnv);
  virtual int getFd() { return masterFd; }
  virtual pid_t getPid() { return pid; }
  virtual ssize_t read(char* buf, size_t count);
  virtual ssize_t write(const char* buf, size_t count);
  virtual void setSize(uint16_t cols, uint16_t rows);
  virtual bool pollExited();
  virtual void cleanup();

 protected:
  /** @brief Runs in the forked child, never returns. */
  void runTerminal(const string& shell, const string& cwd,
                   const map<string, string>& extraEnv);
  /** @brief Non-blocking reap of the child. */
  bool tryReap();

  pid_t pid;
  int masterFd;
  bool reaped;
};
}  // namespace tpod

#endif  // __TPOD_PSEUDO_POD_TERMINAL_HPP__
