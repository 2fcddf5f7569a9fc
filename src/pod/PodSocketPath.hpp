#ifndef __TPOD_POD_SOCKET_PATH__
#define __TPOD_POD_SOCKET_PATH__

#include "Headers.hpp"

namespace tpod {

/**
 * A helper class to locate the directory that holds pod sockets and their
 * metadata sidecars.
 *
 * For root, the directory is /var/run/tpod.
 *
 * For non-root, this is $XDG_RUNTIME_DIR/tpod when XDG_RUNTIME_DIR is an
 * absolute path, and $HOME/.local/share/tpod otherwise. The directory is
 * created with 0700 permissions, so pods may only be reached by the user that
 * started them.
 *
 * The directory may also be overridden from a command line flag or the config
 * file, which disables the auto-detection behavior.
 */
class PodSocketPath {
 public:
  PodSocketPath();

  /**
   * Overrides the socket directory to a user-specified location.
   *
   * @param dir User-specified directory.
   */
  void setDirectoryOverride(const string& dir);

  /**
   * Create the socket directory if it does not exist and verify that it is
   * owned by the current user and not writable by group or other.
   */
  void createDirectoriesIfRequired();

  /** @brief Returns the directory holding pod sockets. */
  string getDirectory() const;

  /** @brief Path of the socket for the given pane uuid. */
  string getSocketPath(const string& uuid) const;
  /** @brief Path of the `.meta` sidecar for the given pane uuid. */
  string getMetaPath(const string& uuid) const;
  /** @brief Path of the human friendly alias symlink for a pod name. */
  string getAliasPath(const string& name) const;

 private:
  optional<string> directoryOverride;
};

}  // namespace tpod

#endif  // __TPOD_POD_SOCKET_PATH__
