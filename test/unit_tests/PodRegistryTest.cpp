#include "PipeSocketHandler.hpp"
#include "PodMetadata.hpp"
#include "PodRegistry.hpp"
#include "TestEnvironment.hpp"
#include "TestHeaders.hpp"

using namespace tpod;

namespace {
const string LIVE_UUID = "11111111111111111111111111111111";
const string DEAD_UUID = "22222222222222222222222222222222";

PodInfo makeInfo(const string& uuid, const string& name, int64_t createdAt) {
  PodInfo info;
  info.set_uuid(uuid);
  info.set_name(name);
  info.set_pid(100);
  info.set_child_pid(101);
  info.set_cwd("/tmp");
  info.add_labels("ci");
  info.set_created_at(createdAt);
  return info;
}

// One pod that is listening and one that died without cleaning up.
class RegistryHarness {
 public:
  RegistryHarness() {
    dir = env.createTempDir();
    paths.setDirectoryOverride(dir);
    handler.reset(new PipeSocketHandler());
    registry.reset(new PodRegistry(handler, paths));

    liveEndpoint.set_name(paths.getSocketPath(LIVE_UUID));
    listener.listen(liveEndpoint);
    PodMetadata::writeSidecar(paths.getMetaPath(LIVE_UUID),
                              makeInfo(LIVE_UUID, "web", 200));

    PodMetadata::writeSidecar(paths.getMetaPath(DEAD_UUID),
                              makeInfo(DEAD_UUID, "web", 100));
    // A regular file refuses connections like a socket nobody listens on.
    std::ofstream(paths.getSocketPath(DEAD_UUID)) << "stale";
  }

  ~RegistryHarness() { listener.stopListening(liveEndpoint); }

  static bool linkExists(const string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
  }

  TestEnvironment env;
  string dir;
  PodSocketPath paths;
  shared_ptr<PipeSocketHandler> handler;
  shared_ptr<PodRegistry> registry;
  PipeSocketHandler listener;
  SocketEndpoint liveEndpoint;
};
}  // namespace

TEST_CASE("Signal names", "[PodRegistry]") {
  REQUIRE(PodRegistry::parseSignal("") == SIGTERM);
  REQUIRE(PodRegistry::parseSignal("TERM") == SIGTERM);
  REQUIRE(PodRegistry::parseSignal("SIGTERM") == SIGTERM);
  REQUIRE(PodRegistry::parseSignal("KILL") == SIGKILL);
  REQUIRE(PodRegistry::parseSignal("SIGINT") == SIGINT);
  REQUIRE(PodRegistry::parseSignal("HUP") == SIGHUP);
  REQUIRE(!PodRegistry::parseSignal("SIG"));
  REQUIRE(!PodRegistry::parseSignal("USR1"));
  REQUIRE(!PodRegistry::parseSignal("term"));
}

TEST_CASE("Listing pods", "[PodRegistry]") {
  RegistryHarness harness;
  const auto& registry = harness.registry;
  REQUIRE(registry->isAlive(harness.paths.getSocketPath(LIVE_UUID)));
  REQUIRE(!registry->isAlive(harness.paths.getSocketPath(DEAD_UUID)));
  REQUIRE(!registry->isAlive(harness.dir + "/missing.sock"));

  SECTION("Without liveness checks") {
    auto records = harness.registry->list(false, false);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].info.uuid() == DEAD_UUID);
    REQUIRE(records[1].info.uuid() == LIVE_UUID);
    REQUIRE(!records[0].alive);
    REQUIRE(PodRegistry::formatRecord(records[0]) ==
            PodMetadata::formatMetaLine(records[0].info));
  }

  SECTION("With liveness checks") {
    auto records = harness.registry->list(true, false);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].alive == false);
    REQUIRE(records[1].alive == true);
    REQUIRE(PodRegistry::formatRecord(records[1]) ==
            "TPOD_POD uuid=" + LIVE_UUID +
                " name=web pid=100 child_pid=101 cwd=/tmp isolated=0 "
                "alive=1 labels=ci created_at=200");

    json j = PodRegistry::toJson(records);
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    REQUIRE(j[0]["uuid"] == DEAD_UUID);
    REQUIRE(j[0]["alive"] == false);
    REQUIRE(j[1]["alive"] == true);
  }

  SECTION("Only live pods") {
    auto records = harness.registry->list(false, true);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].info.uuid() == LIVE_UUID);
    REQUIRE(records[0].alive == true);
  }

  SECTION("Without sidecars the json is an empty array") {
    PodSocketPath emptyPaths;
    emptyPaths.setDirectoryOverride(harness.env.createTempDir());
    PodRegistry empty(harness.handler, emptyPaths);
    REQUIRE(PodRegistry::toJson(empty.list(true, false)).dump() == "[]");
  }
}

TEST_CASE("Garbage collection", "[PodRegistry]") {
  RegistryHarness harness;
  const string liveAlias = harness.dir + "/pod@web.sock";
  const string deadAlias = harness.dir + "/pod@gone.sock";
  const string notes = harness.dir + "/notes.txt";
  REQUIRE(::symlink(harness.paths.getSocketPath(LIVE_UUID).c_str(),
                    liveAlias.c_str()) == 0);
  REQUIRE(::symlink((harness.dir + "/pod-missing.sock").c_str(),
                    deadAlias.c_str()) == 0);
  std::ofstream(notes) << "keep me";

  const vector<string> expected = {
      harness.paths.getMetaPath(DEAD_UUID),
      harness.paths.getSocketPath(DEAD_UUID),
      deadAlias,
  };

  SECTION("Dry run removes nothing") {
    REQUIRE(harness.registry->collectGarbage(true) == expected);
    for (const auto& path : expected) {
      REQUIRE(RegistryHarness::linkExists(path));
    }
  }

  SECTION("Stale files are removed") {
    REQUIRE(harness.registry->collectGarbage(false) == expected);
    for (const auto& path : expected) {
      REQUIRE(!RegistryHarness::linkExists(path));
    }
    REQUIRE(fs::exists(harness.paths.getMetaPath(LIVE_UUID)));
    REQUIRE(fs::exists(harness.paths.getSocketPath(LIVE_UUID)));
    REQUIRE(RegistryHarness::linkExists(liveAlias));
    REQUIRE(fs::exists(notes));

    REQUIRE(harness.registry->collectGarbage(false).empty());
  }
}

TEST_CASE("Finding a pod to signal", "[PodRegistry]") {
  RegistryHarness harness;

  auto byUuid = harness.registry->find(DEAD_UUID, "");
  REQUIRE(byUuid);
  REQUIRE(byUuid->created_at() == 100);

  auto byName = harness.registry->find("", "web");
  REQUIRE(byName);
  REQUIRE(byName->uuid() == LIVE_UUID);

  REQUIRE(!harness.registry->find("", "nobody"));
  REQUIRE(!harness.registry->find(string(UUID_LENGTH, '9'), ""));
  REQUIRE_THROWS_AS(harness.registry->find("short", ""), std::runtime_error);
  REQUIRE_THROWS_AS(harness.registry->find("", ""), std::runtime_error);
}

TEST_CASE("Signaling a pod", "[PodRegistry]") {
  int ready[2];
  REQUIRE(::pipe(ready) == 0);
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    ::close(ready[0]);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_IGN);
    if (::write(ready[1], "r", 1) != 1) {
      _exit(1);
    }
    while (true) {
      ::pause();
    }
  }
  ::close(ready[1]);
  char c;
  REQUIRE(::read(ready[0], &c, 1) == 1);
  ::close(ready[0]);

  int status = 0;
  SECTION("Ignored signals are followed up with SIGKILL") {
    PodRegistry::signalPod(pid, SIGTERM, true);
    REQUIRE(::waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFSIGNALED(status));
    REQUIRE(WTERMSIG(status) == SIGKILL);
  }

  SECTION("Plain signals") {
    PodRegistry::signalPod(pid, SIGINT, false);
    REQUIRE(::waitpid(pid, &status, 0) == pid);
    REQUIRE(WIFSIGNALED(status));
    REQUIRE(WTERMSIG(status) == SIGINT);
  }

  REQUIRE_THROWS_AS(PodRegistry::signalPod(0, SIGTERM, false),
                    std::runtime_error);
  REQUIRE_THROWS_AS(PodRegistry::signalPod(pid, SIGTERM, false),
                    std::runtime_error);
}
