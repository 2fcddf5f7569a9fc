#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "PodConfig.hpp"
#include "PodRegistry.hpp"

using namespace tpod;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tpod::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options(
      "tpod-gc", "Removes sockets, sidecars and aliases of dead pods");
  try {
    options.add_options()                                   //
        ("h,help", "Print help")                            //
        ("version", "Print version")                        //
        ("dry-run", "Only print what would be removed")     //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tpod-gc version " << TPOD_VERSION << endl;
      exit(0);
    }

    PodConfig config;
    const string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty() && !config.load(cfgfilename)) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else if (config.verbose) {
      el::Loggers::setVerboseLevel(config.verbose.value());
    }

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory() + "tpod",
                              "tpod-gc", result.count("logtostdout") > 0,
                              false, true, config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);

    PodSocketPath podPaths;
    if (!config.socketDir.empty()) {
      podPaths.setDirectoryOverride(config.socketDir);
    }
    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    PodRegistry registry(socketHandler, podPaths);

    const bool dryRun = result.count("dry-run") > 0;
    for (const auto& path : registry.collectGarbage(dryRun)) {
      CLOG(INFO, "stdout") << (dryRun ? "gc: would delete " : "gc: deleted ")
                           << path << endl;
    }
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
  return 0;
}
