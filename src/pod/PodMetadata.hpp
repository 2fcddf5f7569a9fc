#ifndef __TPOD_POD_METADATA_H__
#define __TPOD_POD_METADATA_H__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tpod {
/** @brief First token of every metadata line. */
const string POD_META_PREFIX = "TPOD_POD";

/**
 * @brief Reads and writes the grep friendly `.meta` sidecar that lets tools
 * discover running pods without connecting to them.
 *
 * A sidecar holds a single line:
 *
 *   TPOD_POD uuid=<32> name=<name> pid=<pid> child_pid=<pid> cwd=<dir>
 *   isolated=0 labels=a,b created_at=<unix seconds>
 */
class PodMetadata {
 public:
  /** @brief Pane identifiers are exactly UUID_LENGTH characters. */
  static bool isValidUuid(const string& uuid);

  /**
   * @brief Splits a comma separated label list. Blank labels and labels with
   * characters outside [A-Za-z0-9_.-] are dropped.
   */
  static vector<string> parseLabels(const string& csv);

  /**
   * @brief Makes a pod name safe for use in a file name. Disallowed characters
   * become '_', the result is capped at 48 characters and an empty name
   * becomes "pod".
   */
  static string sanitizeAliasName(const string& raw);

  static string formatMetaLine(const PodInfo& info);
  /** @return nullopt unless the line starts with the metadata prefix and
   * carries a valid uuid. */
  static optional<PodInfo> parseMetaLine(const string& line);

  /**
   * @brief Writes the sidecar, replacing any previous contents.
   * @throws std::runtime_error when the file cannot be written.
   */
  static void writeSidecar(const string& path, const PodInfo& info);
  /** @return nullopt when the file is missing or does not hold a pod. */
  static optional<PodInfo> readSidecar(const string& path);
  /** @brief Removes the sidecar, ignoring missing files. */
  static void removeSidecar(const string& path);

  /**
   * @brief Parses every `pod-*.meta` file in dir. Unreadable files and
   * malformed lines are skipped. Results are ordered by creation time.
   */
  static vector<PodInfo> scanDirectory(const string& dir);

  /**
   * @brief Scans dir for `pod-*.meta` files and returns the most recently
   * created pod with the given name.
   */
  static optional<PodInfo> findNewestByName(const string& dir,
                                            const string& name);

  /**
   * @brief Creates a symlink at aliasPath pointing to target. When another
   * pod already owns the alias, "-2", "-3", ... is inserted before the
   * extension.
   * @return The path that was created, or an empty string on failure.
   */
  static string createAliasSymlink(const string& aliasPath,
                                   const string& target);

  static json toJson(const PodInfo& info);
};
}  // namespace tpod

#endif  // __TPOD_POD_METADATA_H__
