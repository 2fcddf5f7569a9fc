#include "PseudoPodTerminal.hpp"

namespace tpod {
PseudoPodTerminal::PseudoPodTerminal() : pid(-1), masterFd(-1), reaped(false) {}

PseudoPodTerminal::~PseudoPodTerminal() { cleanup(); }

int PseudoPodTerminal::setup(const string& shell, const string& cwd,
                             const map<string, string>& extraEnv) {
  winsize win;
  memset(&win, 0, sizeof(win));
  if (!isatty(STDOUT_FILENO) || ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) != 0 ||
      win.ws_col == 0 || win.ws_row == 0) {
    win.ws_col = 80;
    win.ws_row = 24;
  }

  pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1:
      FATAL_FAIL(pid);
      break;
    case 0: {
      runTerminal(shell, cwd, extraEnv);
      _exit(127);
    }
    default: {
      // parent
      break;
    }
  }

  int opts = fcntl(masterFd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(masterFd, F_SETFL, opts | O_NONBLOCK));
  VLOG(1) << "Started " << shell << " as pid " << pid << " on pty fd "
          << masterFd;
  return masterFd;
}

void PseudoPodTerminal::runTerminal(const string& shell, const string& cwd,
                                    const map<string, string>& extraEnv) {
  if (!cwd.empty()) {
    // A missing directory leaves the child where the pod started.
    if (chdir(cwd.c_str()) != 0) {
      fprintf(stderr, "tpod: cannot chdir to %s: %s\n", cwd.c_str(),
              strerror(errno));
    }
  }
  setenv("TERM", "xterm-256color", 1);
  setenv("TPOD", "1", 1);
  for (const auto& it : extraEnv) {
    setenv(it.first.c_str(), it.second.c_str(), 1);
  }
  // Shells remember the inherited SIGCHLD disposition, so hand them the
  // default one.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);

  if (shell.find(' ') != string::npos) {
    execl("/bin/sh", "/bin/sh", "-c", shell.c_str(), (char*)NULL);
  } else {
    execl(shell.c_str(), shell.c_str(), (char*)NULL);
  }
  fprintf(stderr, "tpod: exec %s failed: %s\n", shell.c_str(),
          strerror(errno));
}

ssize_t PseudoPodTerminal::read(char* buf, size_t count) {
  return ::read(masterFd, buf, count);
}

ssize_t PseudoPodTerminal::write(const char* buf, size_t count) {
  return ::write(masterFd, buf, count);
}

void PseudoPodTerminal::setSize(uint16_t cols, uint16_t rows) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = cols;
  win.ws_row = rows;
  if (ioctl(masterFd, TIOCSWINSZ, &win) != 0) {
    LOG(WARNING) << "Could not resize pty to " << cols << "x" << rows << ": "
                 << strerror(errno);
  }
}

bool PseudoPodTerminal::tryReap() {
  if (reaped || pid <= 0) {
    return true;
  }
  int status;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == pid || (rc < 0 && errno == ECHILD)) {
    reaped = true;
  }
  return reaped;
}

bool PseudoPodTerminal::pollExited() { return tryReap(); }

void PseudoPodTerminal::cleanup() {
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
  if (tryReap()) {
    return;
  }
  kill(pid, SIGHUP);
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  if (tryReap()) {
    return;
  }
  kill(pid, SIGKILL);
  for (int i = 0; i < 50; i++) {
    if (tryReap()) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  LOG(WARNING) << "Child " << pid << " was not reaped";
}
}  // namespace tpod
