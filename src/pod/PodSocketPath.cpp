#include "PodSocketPath.hpp"

#include "PodMetadata.hpp"

namespace tpod {

namespace {

const string POD_SUBDIRECTORY = "tpod";
const string ROOT_POD_DIRECTORY = "/var/run/" + POD_SUBDIRECTORY;

struct ValueWithDefault {
  string value;
  bool isDefault;
};

bool IsRoot() { return ::geteuid() == 0; }

bool IsAbsolutePath(const string& path) {
  return (!path.empty() && path[0] == '/');
}

string GetHome() {
  const char* home = getenv("HOME");
  CHECK_NOTNULL(home)
      << "Failed to get the value of the $HOME environment variable.";

  string homeStr(home);
  CHECK(IsAbsolutePath(homeStr))
      << "Unexpected relative path for $HOME environment variable: " << homeStr;
  return homeStr;
}

/**
 * Relative values of XDG_RUNTIME_DIR are invalid and ignored, per the XDG base
 * directory specification.
 */
ValueWithDefault GetXdgRuntimeDir() {
  if (const char* runtimeDir = getenv("XDG_RUNTIME_DIR")) {
    if (IsAbsolutePath(runtimeDir)) {
      return ValueWithDefault{runtimeDir, /*isDefault*/ false};
    }
  }

  return ValueWithDefault{GetHome() + string("/.local/share"),
                          /*isDefault*/ true};
}

void TryCreateDirectory(const string& dir, mode_t mode) {
  // Reset umask to 0 while creating subdirs, and restore after.
  const mode_t oldMode = ::umask(0);

  if (::mkdir(dir.c_str(), mode) == -1) {
    // Permit EEXIST if the directory already exists.
    CHECK_EQ(errno, EEXIST)
        << "Unexpected result creating " << dir << ": " << strerror(errno);
  }

  ::umask(oldMode);
}

}  // namespace

PodSocketPath::PodSocketPath() = default;

void PodSocketPath::setDirectoryOverride(const string& dir) {
  CHECK(!dir.empty()) << "Socket directory must not be empty";
  directoryOverride = dir;
}

string PodSocketPath::getDirectory() const {
  if (directoryOverride) {
    return directoryOverride.value();
  } else if (IsRoot()) {
    return ROOT_POD_DIRECTORY;
  } else {
    return GetXdgRuntimeDir().value + "/" + POD_SUBDIRECTORY;
  }
}

void PodSocketPath::createDirectoriesIfRequired() {
  if (!directoryOverride && !IsRoot()) {
    const auto xdgRuntimeDir = GetXdgRuntimeDir();
    if (xdgRuntimeDir.isDefault) {
      // ~/.local/share may not exist yet on a fresh account.
      const string homeDir = GetHome();
      TryCreateDirectory(homeDir + "/.local", 0755);
      TryCreateDirectory(homeDir + "/.local/share", 0755);
    }
  }

  const string podDir = getDirectory();
  if (directoryOverride) {
    std::error_code ec;
    fs::create_directories(fs::path(podDir).parent_path(), ec);
  }
  TryCreateDirectory(podDir, 0700);

  struct stat podDirStat;
  const int statResult = ::stat(podDir.c_str(), &podDirStat);
  if (statResult != 0) {
    LOG(FATAL) << "Failed to create socket directory: " << podDir << "\n"
               << "Error: " << strerror(errno);
  }

  if (podDirStat.st_uid != ::geteuid()) {
    LOG(FATAL) << "Socket directory must be owned by the current user: "
               << podDir << "\n"
               << "Expected euid=" << ::geteuid()
               << ", actual=" << podDirStat.st_uid;
  }

  if (!S_ISDIR(podDirStat.st_mode)) {
    LOG(FATAL) << "Socket directory must be a directory: " << podDir;
  }

  // Fail if the folder has write permissions to group or other.
  if ((podDirStat.st_mode & (S_IWGRP | S_IWOTH)) != 0) {
    LOG(FATAL) << "Socket directory must not provide write access to "
                  "group/other: "
               << podDir;
  }
}

string PodSocketPath::getSocketPath(const string& uuid) const {
  return getDirectory() + "/pod-" + uuid + ".sock";
}

string PodSocketPath::getMetaPath(const string& uuid) const {
  return getDirectory() + "/pod-" + uuid + ".meta";
}

string PodSocketPath::getAliasPath(const string& name) const {
  return getDirectory() + "/pod@" + PodMetadata::sanitizeAliasName(name) +
         ".sock";
}

}  // namespace tpod
