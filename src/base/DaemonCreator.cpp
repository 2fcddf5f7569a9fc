#include "DaemonCreator.hpp"

namespace tpod {
int DaemonCreator::create(bool parentExit, const string &childPidFile,
                          const string &stderrFile) {
  pid_t pid;

  /* Fork off the parent process */
  pid = fork();

  /* An error occurred */
  if (pid < 0) exit(EXIT_FAILURE);

  /* Success: Return so the parent can continue */
  if (pid > 0) {
    if (parentExit) {
      exit(EXIT_SUCCESS);
    }
    return PARENT;
  }

  /* On success: The child process becomes session leader */
  if (setsid() < 0) exit(EXIT_FAILURE);

  /* Catch, ignore and handle signals */
  signal(SIGHUP, SIG_IGN);

  /* Fork off for the second time*/
  pid = fork();

  /* An error occurred */
  if (pid < 0) exit(EXIT_FAILURE);

  /* Success: Let the parent terminate */
  if (pid > 0) exit(EXIT_SUCCESS);

  /* Child process, write pid file */
  if (!childPidFile.empty()) {
    int pidFilehandle =
        open(childPidFile.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0600);
    if (pidFilehandle == -1) {
      STFATAL << "Error opening pidfile for writing: " << childPidFile;
    }

    std::stringstream pid_ss;
    pid_ss << getpid() << "\n";
    std::string pid_str = pid_ss.str();
    FATAL_FAIL(write(pidFilehandle, pid_str.c_str(), pid_str.length()));
    close(pidFilehandle);
  }

  /* Change the working directory to the root directory */
  FATAL_FAIL(chdir("/"));

  auto fd = open("/dev/null", O_RDWR);
  FATAL_FAIL(fd);
  dup2(fd, STDIN_FILENO);
  dup2(fd, STDOUT_FILENO);
  int errFd = -1;
  if (!stderrFile.empty()) {
    errFd = open(stderrFile.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  }
  if (errFd >= 0) {
    dup2(errFd, STDERR_FILENO);
    if (errFd > STDERR_FILENO) close(errFd);
  } else {
    dup2(fd, STDERR_FILENO);
  }
  if (fd > STDERR_FILENO) close(fd);

  return CHILD;
}
}  // namespace tpod
