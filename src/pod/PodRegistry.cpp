#include "PodRegistry.hpp"

#include "PodMetadata.hpp"

namespace tpod {
namespace {
const int FORCE_KILL_DELAY_MS = 50;

bool hasAffixes(const string& s, const string& prefix, const string& suffix) {
  return s.length() > prefix.length() + suffix.length() &&
         s.compare(0, prefix.length(), prefix) == 0 &&
         s.compare(s.length() - suffix.length(), suffix.length(), suffix) ==
             0;
}
}  // namespace

PodRegistry::PodRegistry(shared_ptr<SocketHandler> _socketHandler,
                         const PodSocketPath& _paths)
    : socketHandler(_socketHandler), paths(_paths) {}

vector<PodRecord> PodRegistry::list(bool checkAlive, bool aliveOnly) const {
  vector<PodRecord> records;
  for (const auto& info : PodMetadata::scanDirectory(paths.getDirectory())) {
    PodRecord record;
    record.info = info;
    if (checkAlive || aliveOnly) {
      record.alive = isAlive(paths.getSocketPath(info.uuid()));
      if (aliveOnly && !record.alive.value()) {
        continue;
      }
    }
    records.push_back(record);
  }
  return records;
}

bool PodRegistry::isAlive(const string& socketPath) const {
  SocketEndpoint endpoint;
  endpoint.set_name(socketPath);
  int fd;
  try {
    fd = socketHandler->connect(endpoint);
  } catch (const std::runtime_error& re) {
    VLOG(1) << "Cannot check " << socketPath << ": " << re.what();
    return false;
  }
  if (fd < 0) {
    return false;
  }
  socketHandler->close(fd);
  return true;
}

vector<string> PodRegistry::collectGarbage(bool dryRun) const {
  const string dir = paths.getDirectory();
  vector<string> stale;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    VLOG(1) << "Cannot scan " << dir << ": " << ec.message();
    return stale;
  }
  for (const auto& entry : it) {
    const string fileName = entry.path().filename().string();
    const string path = entry.path().string();
    std::error_code linkEc;
    const bool isLink = entry.is_symlink(linkEc);
    if (!isLink && hasAffixes(fileName, "pod-", ".meta")) {
      const string uuid = fileName.substr(4, fileName.length() - 9);
      if (PodMetadata::isValidUuid(uuid) &&
          !isAlive(paths.getSocketPath(uuid))) {
        stale.push_back(path);
      }
    } else if (!isLink && hasAffixes(fileName, "pod-", ".sock")) {
      if (!isAlive(path)) {
        stale.push_back(path);
      }
    } else if (isLink && hasAffixes(fileName, "pod@", ".sock")) {
      // Dangling links fail to connect as well.
      if (!isAlive(path)) {
        stale.push_back(path);
      }
    }
  }
  std::sort(stale.begin(), stale.end());

  if (!dryRun) {
    for (const auto& path : stale) {
      std::error_code removeEc;
      fs::remove(path, removeEc);
      if (removeEc) {
        LOG(WARNING) << "Could not remove " << path << ": "
                     << removeEc.message();
      } else {
        LOG(INFO) << "Removed " << path;
      }
    }
  }
  return stale;
}

optional<PodInfo> PodRegistry::find(const string& uuid,
                                    const string& name) const {
  if (!uuid.empty()) {
    if (!PodMetadata::isValidUuid(uuid)) {
      throw std::runtime_error("--uuid must be " + to_string(UUID_LENGTH) +
                               " characters");
    }
    return PodMetadata::readSidecar(paths.getMetaPath(uuid));
  }
  if (name.empty()) {
    throw std::runtime_error("One of --uuid or --name is required");
  }
  return PodMetadata::findNewestByName(paths.getDirectory(), name);
}

optional<int> PodRegistry::parseSignal(const string& name) {
  if (name.empty()) {
    return SIGTERM;
  }
  string s = name;
  if (s.rfind("SIG", 0) == 0) {
    s = s.substr(3);
  }
  if (s == "TERM") {
    return SIGTERM;
  }
  if (s == "KILL") {
    return SIGKILL;
  }
  if (s == "INT") {
    return SIGINT;
  }
  if (s == "HUP") {
    return SIGHUP;
  }
  return std::nullopt;
}

void PodRegistry::signalPod(pid_t pid, int signum, bool force) {
  if (pid <= 0) {
    throw std::runtime_error("Invalid pod pid: " + to_string(pid));
  }
  if (::kill(pid, signum) != 0) {
    throw std::runtime_error("Cannot signal pid " + to_string(pid) + ": " +
                             strerror(GetErrno()));
  }
  VLOG(1) << "Sent signal " << signum << " to " << pid;
  if (force && signum != SIGKILL) {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(FORCE_KILL_DELAY_MS));
    if (::kill(pid, SIGKILL) != 0 && GetErrno() != ESRCH) {
      LOG(WARNING) << "Cannot kill pid " << pid << ": "
                   << strerror(GetErrno());
    }
  }
}

string PodRegistry::formatRecord(const PodRecord& record) {
  string line = PodMetadata::formatMetaLine(record.info);
  if (record.alive) {
    const string alive =
        string(" alive=") + (record.alive.value() ? "1" : "0");
    auto labels = line.find(" labels=");
    if (labels == string::npos) {
      line += alive;
    } else {
      line.insert(labels, alive);
    }
  }
  return line;
}

json PodRegistry::toJson(const vector<PodRecord>& records) {
  json pods = json::array();
  for (const auto& record : records) {
    json pod = PodMetadata::toJson(record.info);
    if (record.alive) {
      pod["alive"] = record.alive.value();
    }
    pods.push_back(pod);
  }
  return pods;
}
}  // namespace tpod
