#include "PodConfig.hpp"
#include "TestEnvironment.hpp"
#include "TestHeaders.hpp"

using namespace tpod;

TEST_CASE("Config defaults", "[PodConfig]") {
  PodConfig config;
  REQUIRE(config.shell.empty());
  REQUIRE(config.socketDir.empty());
  REQUIRE(!config.verbose);
  REQUIRE(!config.silent);
  REQUIRE(config.maxLogSize == "20971520");
}

TEST_CASE("Config file loading", "[PodConfig]") {
  TestEnvironment env;
  const string path = env.createTempDir() + "/tpod.cfg";
  {
    std::ofstream out(path);
    out << "; tpod configuration\n"
        << "[Pod]\n"
        << "shell = /bin/zsh\n"
        << "cwd = /srv/work \n"
        << "socketdir = /run/pods\n"
        << "\n"
        << "[Debug]\n"
        << "verbose = 3\n"
        << "silent = 1\n"
        << "logsize = 1048576\n";
  }

  PodConfig config;
  REQUIRE(config.load(path));
  REQUIRE(config.shell == "/bin/zsh");
  REQUIRE(config.cwd == "/srv/work");
  REQUIRE(config.socketDir == "/run/pods");
  REQUIRE(config.verbose);
  REQUIRE(*config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1048576");
}

TEST_CASE("Partial config keeps defaults", "[PodConfig]") {
  TestEnvironment env;
  const string path = env.createTempDir() + "/tpod.cfg";
  {
    std::ofstream out(path);
    out << "[Debug]\n"
        << "silent = 0\n"
        << "logsize = nonsense\n";
  }

  PodConfig config;
  REQUIRE(config.load(path));
  REQUIRE(config.shell.empty());
  REQUIRE(!config.verbose);
  REQUIRE(!config.silent);
  REQUIRE(config.maxLogSize == "20971520");
}

TEST_CASE("Missing config file", "[PodConfig]") {
  TestEnvironment env;
  PodConfig config;
  REQUIRE(!config.load(env.createTempDir() + "/missing.cfg"));
}

TEST_CASE("Shell resolution", "[PodConfig]") {
  TestEnvironment env;
  PodConfig config;

  env.setEnv("SHELL", "/bin/bash");
  REQUIRE(config.resolveShell("") == "/bin/bash");
  REQUIRE(config.resolveShell("/usr/bin/fish") == "/usr/bin/fish");

  config.shell = "/bin/zsh";
  REQUIRE(config.resolveShell("") == "/bin/zsh");
  REQUIRE(config.resolveShell("/usr/bin/fish") == "/usr/bin/fish");

  config.shell.clear();
  env.unsetEnv("SHELL");
  REQUIRE(config.resolveShell("") == "/bin/sh");
}
