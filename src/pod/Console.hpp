#ifndef __TPOD_CONSOLE_HPP__
#define __TPOD_CONSOLE_HPP__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace tpod {
/**
 * @brief Abstract console used by tpod-attach.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Returns the console size in rows and columns. */
  virtual TerminalInfo getTerminalInfo() = 0;
  /** @brief Prepares the console before proxying keystrokes. */
  virtual void setup() = 0;
  /** @brief Restores the console state before exiting. */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives pod output. */
  virtual int getFd() = 0;
  /** @brief Descriptor that produces keystrokes. */
  virtual int getInputFd() = 0;

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(getFd(), &s[0], s.length());
  }
};
}  // namespace tpod

#endif  // __TPOD_CONSOLE_HPP__
