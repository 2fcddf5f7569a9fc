#ifndef __TPOD_DAEMON_CREATOR_H__
#define __TPOD_DAEMON_CREATOR_H__

#include "Headers.hpp"

namespace tpod {
/**
 * @brief Helper to daemonize the pod process.
 */
class DaemonCreator {
 public:
  /**
   * @brief Forks twice, optionally exiting the parent, and redirects stdio to
   * /dev/null.
   * @param terminateParent Whether the parent should exit immediately after
   * forking.
   * @param childPidFile Optional path to a pid file that is written by the
   * daemon.
   * @param stderrFile Optional file that receives the daemon's stderr instead
   * of /dev/null.
   * @return PARENT when running inside the original parent, CHILD inside the
   * daemon.
   */
  static int create(bool terminateParent, const string &childPidFile,
                    const string &stderrFile);

  /** @brief Returned from `create()` when still running inside the original
   * parent. */
  static const int PARENT = 1;
  /** @brief Returned from `create()` when the call is executing inside the
   * daemon. */
  static const int CHILD = 2;
};
}  // namespace tpod

#endif  // __TPOD_DAEMON_CREATOR_H__
