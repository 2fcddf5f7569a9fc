#include "PodMetadata.hpp"

namespace tpod {
namespace {
const size_t MAX_ALIAS_LENGTH = 48;
const int MAX_ALIAS_ATTEMPTS = 100;

bool isNameChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
}

bool setField(PodInfo* info, const string& key, const string& value) {
  if (key == "uuid") {
    info->set_uuid(value);
  } else if (key == "name") {
    info->set_name(value);
  } else if (key == "pid") {
    info->set_pid(atoi(value.c_str()));
  } else if (key == "child_pid") {
    info->set_child_pid(atoi(value.c_str()));
  } else if (key == "cwd") {
    info->set_cwd(value);
  } else if (key == "isolated") {
    info->set_isolated(value == "1");
  } else if (key == "labels") {
    info->clear_labels();
    for (const auto& label : PodMetadata::parseLabels(value)) {
      info->add_labels(label);
    }
  } else if (key == "created_at") {
    info->set_created_at(strtoll(value.c_str(), NULL, 10));
  } else {
    return false;
  }
  return true;
}
}  // namespace

bool PodMetadata::isValidUuid(const string& uuid) {
  return uuid.length() == size_t(UUID_LENGTH);
}

vector<string> PodMetadata::parseLabels(const string& csv) {
  vector<string> labels;
  for (const auto& part : split(trim(csv), ',')) {
    string label = trim(part);
    if (label.empty()) {
      continue;
    }
    if (std::all_of(label.begin(), label.end(), isNameChar)) {
      labels.push_back(label);
    }
  }
  return labels;
}

string PodMetadata::sanitizeAliasName(const string& raw) {
  string s = raw.substr(0, MAX_ALIAS_LENGTH);
  for (auto& c : s) {
    if (!isNameChar(c)) {
      c = '_';
    }
  }
  if (s.empty()) {
    return "pod";
  }
  return s;
}

string PodMetadata::formatMetaLine(const PodInfo& info) {
  std::ostringstream ss;
  ss << POD_META_PREFIX << " uuid=" << info.uuid() << " name=" << info.name()
     << " pid=" << info.pid() << " child_pid=" << info.child_pid()
     << " cwd=" << info.cwd() << " isolated=" << (info.isolated() ? 1 : 0)
     << " labels=";
  for (int i = 0; i < info.labels_size(); i++) {
    if (i) {
      ss << ",";
    }
    ss << info.labels(i);
  }
  ss << " created_at=" << info.created_at();
  return ss.str();
}

optional<PodInfo> PodMetadata::parseMetaLine(const string& line) {
  vector<string> tokens = split(trim(line), ' ');
  if (tokens.empty() || tokens[0] != POD_META_PREFIX) {
    return std::nullopt;
  }
  PodInfo info;
  string lastKey;
  string lastValue;
  for (size_t i = 1; i < tokens.size(); i++) {
    const string& token = tokens[i];
    auto eq = token.find('=');
    if (eq != string::npos && eq > 0) {
      string key = token.substr(0, eq);
      string value = token.substr(eq + 1);
      if (setField(&info, key, value)) {
        lastKey = key;
        lastValue = value;
        continue;
      }
    }
    // A value containing spaces (typically cwd) was split apart.
    if (!lastKey.empty()) {
      lastValue += " " + token;
      setField(&info, lastKey, lastValue);
    }
  }
  if (!isValidUuid(info.uuid())) {
    return std::nullopt;
  }
  return info;
}

void PodMetadata::writeSidecar(const string& path, const PodInfo& info) {
  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
  }
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Could not open " + path + " for writing");
  }
  out << formatMetaLine(info) << "\n";
  out.close();
  if (!out) {
    throw std::runtime_error("Could not write " + path);
  }
  ::chmod(path.c_str(), 0644);
}

optional<PodInfo> PodMetadata::readSidecar(const string& path) {
  std::ifstream in(path);
  string line;
  if (!in || !std::getline(in, line)) {
    return std::nullopt;
  }
  return parseMetaLine(line);
}

void PodMetadata::removeSidecar(const string& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LOG(WARNING) << "Could not remove " << path << ": " << ec.message();
  }
}

vector<PodInfo> PodMetadata::scanDirectory(const string& dir) {
  vector<PodInfo> pods;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    VLOG(1) << "Cannot scan " << dir << ": " << ec.message();
    return pods;
  }
  for (const auto& entry : it) {
    const string fileName = entry.path().filename().string();
    if (fileName.rfind("pod-", 0) != 0 || fileName.length() < 5 ||
        fileName.compare(fileName.length() - 5, 5, ".meta") != 0) {
      continue;
    }
    auto info = readSidecar(entry.path().string());
    if (info) {
      pods.push_back(*info);
    }
  }
  std::stable_sort(pods.begin(), pods.end(),
                   [](const PodInfo& a, const PodInfo& b) {
                     if (a.created_at() != b.created_at()) {
                       return a.created_at() < b.created_at();
                     }
                     return a.uuid() < b.uuid();
                   });
  return pods;
}

optional<PodInfo> PodMetadata::findNewestByName(const string& dir,
                                                const string& name) {
  optional<PodInfo> best;
  for (const auto& info : scanDirectory(dir)) {
    if (info.name() == name) {
      best = info;
    }
  }
  return best;
}

string PodMetadata::createAliasSymlink(const string& aliasPath,
                                       const string& target) {
  string base = aliasPath;
  string extension;
  auto dot = aliasPath.rfind('.');
  auto slash = aliasPath.rfind('/');
  if (dot != string::npos && (slash == string::npos || dot > slash)) {
    base = aliasPath.substr(0, dot);
    extension = aliasPath.substr(dot);
  }

  for (int attempt = 0; attempt < MAX_ALIAS_ATTEMPTS; attempt++) {
    string candidate =
        attempt == 0 ? aliasPath
                     : base + "-" + to_string(attempt + 1) + extension;
    // An alias whose pod is gone leaves a dangling link behind.
    struct stat targetStat;
    if (::lstat(candidate.c_str(), &targetStat) == 0 &&
        ::stat(candidate.c_str(), &targetStat) != 0) {
      ::unlink(candidate.c_str());
    }
    if (::symlink(target.c_str(), candidate.c_str()) == 0) {
      VLOG(1) << "Created alias " << candidate << " -> " << target;
      return candidate;
    }
    if (errno != EEXIST) {
      LOG(WARNING) << "Could not create alias " << candidate << ": "
                   << strerror(errno);
      return "";
    }
  }
  LOG(WARNING) << "Gave up creating an alias for " << target;
  return "";
}

json PodMetadata::toJson(const PodInfo& info) {
  json j;
  j["uuid"] = info.uuid();
  j["name"] = info.name();
  j["pid"] = info.pid();
  j["child_pid"] = info.child_pid();
  j["cwd"] = info.cwd();
  j["isolated"] = info.isolated();
  j["labels"] = vector<string>(info.labels().begin(), info.labels().end());
  j["created_at"] = info.created_at();
  return j;
}
}  // namespace tpod
