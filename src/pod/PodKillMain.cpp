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

  cxxopts::Options options("tpod-kill", "Signals a running pod");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("uuid", "Pane identifier of the pod",
         cxxopts::value<std::string>()->default_value(""))  //
        ("name", "Name of the pod (newest match wins)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("signal", "TERM, KILL, INT or HUP",
         cxxopts::value<std::string>()->default_value("TERM"))  //
        ("force", "Follow up with SIGKILL")                     //
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
      CLOG(INFO, "stdout") << "tpod-kill version " << TPOD_VERSION << endl;
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
                              "tpod-kill", result.count("logtostdout") > 0,
                              false, true, config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);

    auto signum = PodRegistry::parseSignal(result["signal"].as<string>());
    if (!signum) {
      CLOG(INFO, "stdout") << "Error: invalid --signal" << endl;
      exit(1);
    }

    PodSocketPath podPaths;
    if (!config.socketDir.empty()) {
      podPaths.setDirectoryOverride(config.socketDir);
    }
    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    PodRegistry registry(socketHandler, podPaths);
    try {
      auto info = registry.find(result["uuid"].as<string>(),
                                result["name"].as<string>());
      if (!info) {
        CLOG(INFO, "stdout") << "pod not found" << endl;
        exit(1);
      }
      PodRegistry::signalPod(pid_t(info->pid()), signum.value(),
                             result.count("force") > 0);
      LOG(INFO) << "Signaled pod " << info->uuid() << " (pid " << info->pid()
                << ")";
    } catch (const std::runtime_error& re) {
      CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
      exit(1);
    }
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
  return 0;
}
