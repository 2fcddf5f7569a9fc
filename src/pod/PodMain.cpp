#include <cxxopts.hpp>

#ifdef __linux__
#include <sys/prctl.h>
#endif

#include "DaemonCreator.hpp"
#include "JsonLib.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "PodConfig.hpp"
#include "PodMetadata.hpp"
#include "PodServer.hpp"
#include "PodSocketPath.hpp"
#include "PseudoPodTerminal.hpp"

using namespace tpod;

namespace {
void setProcessName(const string& name) {
#ifdef __linux__
  if (name.empty()) {
    return;
  }
  // The kernel keeps at most 15 characters.
  string comm = ("tpod:" + PodMetadata::sanitizeAliasName(name)).substr(0, 15);
  prctl(PR_SET_NAME, comm.c_str(), 0, 0, 0);
#endif
}

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tpod::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tpod::InterruptSignalHandler);
  // A client that vanishes mid-write must not take the pod down with it.
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tpod",
                           "Runs one terminal pane as a detachable pod");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("uuid", "Pane identifier (32 characters)",
         cxxopts::value<std::string>())  //
        ("socket", "Unix socket to listen on",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Command to run in the pty",
         cxxopts::value<std::string>()->default_value(""))  //
        ("cwd", "Working directory of the command",
         cxxopts::value<std::string>()->default_value(""))  //
        ("name", "Human friendly pod name",
         cxxopts::value<std::string>()->default_value(""))  //
        ("labels", "Comma separated labels stored in the metadata file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("daemon", "Daemonize the pod")                     //
        ("ready", "Print a pod_ready json line once listening")  //
        ("debug", "Log to stdout")                               //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logfile", "File that receives stderr",
         cxxopts::value<std::string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("no-meta", "Do not write the .meta discovery file")  //
        ("alias", "Create a pod@<name>.sock alias symlink")    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tpod version " << TPOD_VERSION << endl;
      exit(0);
    }

    if (!result.count("uuid")) {
      CLOG(INFO, "stdout") << "Missing required option --uuid" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }
    const string uuid = result["uuid"].as<string>();
    if (!PodMetadata::isValidUuid(uuid)) {
      CLOG(INFO, "stdout") << "--uuid must be " << UUID_LENGTH
                           << " characters" << endl;
      exit(1);
    }

    PodConfig config;
    const string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty() && !config.load(cfgfilename)) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }

    // read verbose level (prioritize command line option over cfgfile)
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else if (config.verbose) {
      el::Loggers::setVerboseLevel(config.verbose.value());
    }

    PodSocketPath podPaths;
    if (!config.socketDir.empty()) {
      podPaths.setDirectoryOverride(config.socketDir);
    }
    podPaths.createDirectoriesIfRequired();

    string socketPath = result["socket"].as<string>();
    if (socketPath.empty()) {
      socketPath = podPaths.getSocketPath(uuid);
    }
    const string name = result["name"].as<string>();
    string cwd = result["cwd"].as<string>();
    if (cwd.empty()) {
      cwd = config.cwd;
    }
    const string shell = config.resolveShell(result["shell"].as<string>());
    const string logFile = result["logfile"].as<string>();
    const bool daemon = result.count("daemon") > 0;
    const bool debug = result.count("debug") > 0;

    if (daemon) {
      DaemonCreator::create(true, "", logFile);
    } else if (!logFile.empty()) {
      LogHandler::stderrToLogFile(logFile);
    }

    string logDir = result["logdir"].as<string>();
    if (logDir.empty()) {
      logDir = GetTempDirectory() + "tpod";
    }
    LogHandler::setupLogFiles(&defaultConf, logDir, "tpod-" + uuid.substr(0, 8),
                              debug && !daemon, false, true,
                              config.maxLogSize);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("tpod-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    setProcessName(name);

    map<string, string> extraEnv = {
        {"TPOD_PANE_UUID", uuid},
        {"TPOD_POD_SOCKET", socketPath},
    };
    if (!name.empty()) {
      extraEnv["TPOD_POD_NAME"] = name;
    }
    shared_ptr<PseudoPodTerminal> terminal(new PseudoPodTerminal());
    terminal->setup(shell, cwd, extraEnv);

    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    SocketEndpoint endpoint;
    endpoint.set_name(socketPath);

    LOG(INFO) << "Starting pod " << uuid << " running " << shell << " on "
              << socketPath;
    {
      PodServer server(socketHandler, endpoint, terminal, uuid);

      const bool writeMeta = result.count("no-meta") == 0;
      const string metaPath = podPaths.getMetaPath(uuid);
      if (writeMeta) {
        PodInfo info;
        info.set_uuid(uuid);
        info.set_name(name);
        info.set_pid(getpid());
        info.set_child_pid(terminal->getPid());
        info.set_cwd(cwd);
        info.set_isolated(false);
        for (const auto& label :
             PodMetadata::parseLabels(result["labels"].as<string>())) {
          info.add_labels(label);
        }
        info.set_created_at(int64_t(time(NULL)));
        try {
          PodMetadata::writeSidecar(metaPath, info);
        } catch (const std::runtime_error& re) {
          LOG(ERROR) << "Could not write metadata: " << re.what();
        }
      }

      string aliasPath;
      if (result.count("alias") && !name.empty()) {
        aliasPath = PodMetadata::createAliasSymlink(
            podPaths.getAliasPath(name), socketPath);
      }

      if (result.count("ready")) {
        ordered_json ready;
        ready["type"] = "pod_ready";
        ready["uuid"] = uuid;
        ready["pid"] = terminal->getPid();
        CLOG(INFO, "stdout") << ready.dump();
        std::cout.flush();
      }

      try {
        server.run();
      } catch (const std::runtime_error& re) {
        LOG(ERROR) << "Pod session failed: " << re.what();
        exitCode = 1;
      }

      if (writeMeta) {
        PodMetadata::removeSidecar(metaPath);
      }
      if (!aliasPath.empty()) {
        ::unlink(aliasPath.c_str());
      }
    }
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const std::runtime_error& re) {
    STERROR << "Could not start pod: " << re.what();
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
