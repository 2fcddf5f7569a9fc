#ifndef __TPOD_POD_REGISTRY_H__
#define __TPOD_POD_REGISTRY_H__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PodSocketPath.hpp"
#include "SocketHandler.hpp"

namespace tpod {
/** @brief A pod discovered through its sidecar. */
struct PodRecord {
  PodInfo info;
  /** @brief Only set when liveness was checked. */
  optional<bool> alive;
};

/**
 * @brief Finds the pods in the socket directory, checks which ones still
 * accept connections and removes what dead pods leave behind. Used by
 * tpod-list, tpod-gc and tpod-kill.
 *
 * A liveness check connects to the pod and hangs up right away without
 * sending anything. Pods skip such connections instead of replaying their
 * backlog.
 */
class PodRegistry {
 public:
  PodRegistry(shared_ptr<SocketHandler> _socketHandler,
              const PodSocketPath& _paths);

  /**
   * @brief Returns the pods with a readable sidecar, oldest first.
   * @param checkAlive Connect to each socket to fill in `alive`.
   * @param aliveOnly Only return pods that accept connections. Implies
   * checkAlive.
   */
  vector<PodRecord> list(bool checkAlive, bool aliveOnly) const;

  /** @brief Returns true when something accepts connections on the socket. */
  bool isAlive(const string& socketPath) const;

  /**
   * @brief Finds sidecars and sockets of pods that no longer accept
   * connections, plus `pod@` aliases that do not lead to a live pod, and
   * removes them unless dryRun is set.
   * @return The stale paths, sorted.
   */
  vector<string> collectGarbage(bool dryRun) const;

  /**
   * @brief Looks a pod up by uuid, or else the newest pod with the name.
   * @throws std::runtime_error on a malformed uuid or when neither is given.
   */
  optional<PodInfo> find(const string& uuid, const string& name) const;

  /**
   * @brief Accepts TERM, KILL, INT and HUP, with or without the SIG prefix.
   * An empty name means TERM.
   */
  static optional<int> parseSignal(const string& name);

  /**
   * @brief Sends signum to pid. With force, SIGKILL follows shortly after.
   * @throws std::runtime_error when the first signal cannot be delivered.
   */
  static void signalPod(pid_t pid, int signum, bool force);

  /** @brief The metadata line, with `alive=` when liveness was checked. */
  static string formatRecord(const PodRecord& record);
  static json toJson(const vector<PodRecord>& records);

 protected:
  shared_ptr<SocketHandler> socketHandler;
  PodSocketPath paths;
};
}  // namespace tpod

#endif  // __TPOD_POD_REGISTRY_H__
