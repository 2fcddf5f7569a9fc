#ifndef __TPOD_POD_CONFIG_H__
#define __TPOD_POD_CONFIG_H__

#include "Headers.hpp"

namespace tpod {
/**
 * @brief Settings read from the optional INI config file.
 *
 * [Pod]
 * shell = /bin/zsh
 * cwd = /home/me
 * socketdir = /run/user/1000/tpod
 *
 * [Debug]
 * verbose = 1
 * logsize = 20971520
 * silent = 0
 *
 * Command line flags take precedence over every value here.
 */
class PodConfig {
 public:
  PodConfig();

  /**
   * @brief Loads the config file.
   * @return false when the file cannot be read or parsed.
   */
  bool load(const string& path);

  /**
   * @brief Picks the shell to run: the command line value, then the config
   * file, then $SHELL, then /bin/sh.
   */
  string resolveShell(const string& cliShell) const;

  string shell;
  string cwd;
  string socketDir;
  optional<int> verbose;
  bool silent;
  string maxLogSize;
};
}  // namespace tpod

#endif  // __TPOD_POD_CONFIG_H__
