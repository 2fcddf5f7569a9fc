#ifndef __TPOD_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __TPOD_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"

namespace tpod {
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : isRaw(false) {
    memset(&terminal_backup, 0, sizeof(struct termios));
  }

  virtual ~PseudoTerminalConsole() {}

  virtual void setup() {
    termios terminal_local;
    if (tcgetattr(STDIN_FILENO, &terminal_local) != 0) {
      // Not a tty, keystrokes are forwarded as they come.
      return;
    }
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local);
    isRaw = true;
  }

  virtual void teardown() {
    if (isRaw) {
      tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
      isRaw = false;
    }
  }

  virtual TerminalInfo getTerminalInfo() {
    winsize win;
    memset(&win, 0, sizeof(win));
    TerminalInfo ti;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) != 0 || win.ws_col == 0 ||
        win.ws_row == 0) {
      win.ws_col = 80;
      win.ws_row = 24;
    }
    ti.set_row(win.ws_row);
    ti.set_column(win.ws_col);
    ti.set_width(win.ws_xpixel);
    ti.set_height(win.ws_ypixel);
    return ti;
  }

  virtual int getFd() { return STDOUT_FILENO; }
  virtual int getInputFd() { return STDIN_FILENO; }

 protected:
  termios terminal_backup;
  bool isRaw;
};
}  // namespace tpod

#endif  // __TPOD_PSEUDO_TERMINAL_CONSOLE_HPP__
