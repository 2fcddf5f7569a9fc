#include "PodMetadata.hpp"
#include "TestEnvironment.hpp"
#include "TestHeaders.hpp"

using namespace tpod;

namespace {
PodInfo makeInfo(const string& uuid, const string& name, int64_t createdAt) {
  PodInfo info;
  info.set_uuid(uuid);
  info.set_name(name);
  info.set_pid(1234);
  info.set_child_pid(1235);
  info.set_cwd("/home/me/src");
  info.add_labels("web");
  info.add_labels("dev");
  info.set_created_at(createdAt);
  return info;
}

const string UUID_A = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
const string UUID_B = "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
const string UUID_C = "cccccccccccccccccccccccccccccccc";
}  // namespace

TEST_CASE("Uuid validation", "[PodMetadata]") {
  REQUIRE(PodMetadata::isValidUuid(UUID_A));
  REQUIRE(!PodMetadata::isValidUuid(""));
  REQUIRE(!PodMetadata::isValidUuid(UUID_A.substr(1)));
  REQUIRE(!PodMetadata::isValidUuid(UUID_A + "a"));
}

TEST_CASE("Label parsing", "[PodMetadata]") {
  REQUIRE(PodMetadata::parseLabels("") == vector<string>());
  REQUIRE(PodMetadata::parseLabels("a, b ,,c") ==
          vector<string>({"a", "b", "c"}));
  REQUIRE(PodMetadata::parseLabels("ok,not ok,bad!,v1.2_x-y") ==
          vector<string>({"ok", "v1.2_x-y"}));
}

TEST_CASE("Alias name sanitizing", "[PodMetadata]") {
  REQUIRE(PodMetadata::sanitizeAliasName("build") == "build");
  REQUIRE(PodMetadata::sanitizeAliasName("a/b c") == "a_b_c");
  REQUIRE(PodMetadata::sanitizeAliasName("") == "pod");
  REQUIRE(PodMetadata::sanitizeAliasName(string(100, 'x')) == string(48, 'x'));
}

TEST_CASE("Metadata lines", "[PodMetadata]") {
  PodInfo info = makeInfo(UUID_A, "build", 1700000000);
  string line = PodMetadata::formatMetaLine(info);
  REQUIRE(line ==
          "TPOD_POD uuid=" + UUID_A +
              " name=build pid=1234 child_pid=1235 cwd=/home/me/src "
              "isolated=0 labels=web,dev created_at=1700000000");

  auto parsed = PodMetadata::parseMetaLine(line + "\n");
  REQUIRE(parsed);
  REQUIRE(parsed->uuid() == UUID_A);
  REQUIRE(parsed->name() == "build");
  REQUIRE(parsed->pid() == 1234);
  REQUIRE(parsed->child_pid() == 1235);
  REQUIRE(parsed->cwd() == "/home/me/src");
  REQUIRE(!parsed->isolated());
  REQUIRE(parsed->labels_size() == 2);
  REQUIRE(parsed->labels(1) == "dev");
  REQUIRE(parsed->created_at() == 1700000000);

  SECTION("Values with spaces") {
    info.set_cwd("/home/me/My Documents");
    auto spaced = PodMetadata::parseMetaLine(PodMetadata::formatMetaLine(info));
    REQUIRE(spaced);
    REQUIRE(spaced->cwd() == "/home/me/My Documents");
    REQUIRE(spaced->created_at() == 1700000000);
  }

  SECTION("Rejected lines") {
    REQUIRE(!PodMetadata::parseMetaLine(""));
    REQUIRE(!PodMetadata::parseMetaLine("OTHER uuid=" + UUID_A));
    REQUIRE(!PodMetadata::parseMetaLine("TPOD_POD uuid=short name=x"));
  }
}

TEST_CASE("Sidecar files", "[PodMetadata]") {
  TestEnvironment env;
  const string dir = env.createTempDir();

  PodMetadata::writeSidecar(dir + "/pod-" + UUID_A + ".meta",
                            makeInfo(UUID_A, "build", 100));
  PodMetadata::writeSidecar(dir + "/pod-" + UUID_B + ".meta",
                            makeInfo(UUID_B, "build", 300));
  PodMetadata::writeSidecar(dir + "/pod-" + UUID_C + ".meta",
                            makeInfo(UUID_C, "other", 500));
  // Files that do not look like sidecars are skipped.
  PodMetadata::writeSidecar(dir + "/notes.meta",
                            makeInfo(UUID_C, "build", 900));
  std::ofstream(dir + "/pod-garbage.meta") << "not metadata\n";

  struct stat st;
  REQUIRE(::stat((dir + "/pod-" + UUID_A + ".meta").c_str(), &st) == 0);
  REQUIRE((st.st_mode & 0777) == 0644);

  auto pods = PodMetadata::scanDirectory(dir);
  REQUIRE(pods.size() == 3);
  REQUIRE(pods[0].uuid() == UUID_A);
  REQUIRE(pods[1].uuid() == UUID_B);
  REQUIRE(pods[2].uuid() == UUID_C);
  REQUIRE(PodMetadata::scanDirectory(dir + "/nope").empty());

  auto newest = PodMetadata::findNewestByName(dir, "build");
  REQUIRE(newest);
  REQUIRE(newest->uuid() == UUID_B);

  REQUIRE(!PodMetadata::findNewestByName(dir, "missing"));
  REQUIRE(!PodMetadata::findNewestByName(dir + "/nope", "build"));

  PodMetadata::removeSidecar(dir + "/pod-" + UUID_B + ".meta");
  newest = PodMetadata::findNewestByName(dir, "build");
  REQUIRE(newest);
  REQUIRE(newest->uuid() == UUID_A);

  // Removing twice is harmless.
  PodMetadata::removeSidecar(dir + "/pod-" + UUID_B + ".meta");

  REQUIRE_THROWS_AS(
      PodMetadata::writeSidecar(dir + "/pod-" + UUID_A + ".meta/child",
                                makeInfo(UUID_A, "build", 1)),
      std::runtime_error);
}

TEST_CASE("Alias symlinks", "[PodMetadata]") {
  TestEnvironment env;
  const string dir = env.createTempDir();
  const string targetA = dir + "/pod-" + UUID_A + ".sock";
  const string targetB = dir + "/pod-" + UUID_B + ".sock";
  std::ofstream(targetA) << "";
  std::ofstream(targetB) << "";
  const string alias = dir + "/pod@build.sock";

  REQUIRE(PodMetadata::createAliasSymlink(alias, targetA) == alias);
  REQUIRE(fs::read_symlink(alias).string() == targetA);

  SECTION("Live aliases get a suffix") {
    REQUIRE(PodMetadata::createAliasSymlink(alias, targetB) ==
            dir + "/pod@build-2.sock");
    REQUIRE(PodMetadata::createAliasSymlink(alias, targetB) ==
            dir + "/pod@build-3.sock");
  }

  SECTION("Dangling aliases are replaced") {
    fs::remove(targetA);
    REQUIRE(PodMetadata::createAliasSymlink(alias, targetB) == alias);
    REQUIRE(fs::read_symlink(alias).string() == targetB);
  }
}

TEST_CASE("Json output", "[PodMetadata]") {
  json j = PodMetadata::toJson(makeInfo(UUID_A, "build", 42));
  REQUIRE(j["uuid"] == UUID_A);
  REQUIRE(j["name"] == "build");
  REQUIRE(j["pid"] == 1234);
  REQUIRE(j["child_pid"] == 1235);
  REQUIRE(j["isolated"] == false);
  REQUIRE(j["labels"] == json::array({"web", "dev"}));
  REQUIRE(j["created_at"] == 42);
}
