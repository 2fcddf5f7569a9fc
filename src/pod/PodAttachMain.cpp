#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "PodClient.hpp"
#include "PodConfig.hpp"
#include "PseudoTerminalConsole.hpp"

using namespace tpod;

namespace {
int winchWriteFd = -1;

void winchHandler(int) {
  if (winchWriteFd >= 0) {
    int savedErrno = errno;
    char c = 1;
    // Best effort, a full pipe already holds a pending resize.
    ssize_t rc = ::write(winchWriteFd, &c, 1);
    (void)rc;
    errno = savedErrno;
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tpod::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tpod-attach",
                           "Attaches this terminal to a running pod");
  int exitCode = 0;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("uuid", "Pane identifier of the pod",
         cxxopts::value<std::string>()->default_value(""))  //
        ("name", "Name of the pod (newest match wins)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("socket", "Socket path of the pod",
         cxxopts::value<std::string>()->default_value(""))  //
        ("detach-key", "Detach with Ctrl+<key> followed by d",
         cxxopts::value<std::string>()->default_value("b"))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tpod-attach version " << TPOD_VERSION << endl;
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

    // The console is in raw mode while attached, so only log to a file.
    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory() + "tpod",
                              "tpod-attach", false, true, true,
                              config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    string socketPath;
    try {
      PodSocketPath podPaths;
      if (!config.socketDir.empty()) {
        podPaths.setDirectoryOverride(config.socketDir);
      }
      socketPath = PodClient::resolveSocket(
          result["socket"].as<string>(), result["uuid"].as<string>(),
          result["name"].as<string>(), podPaths);
    } catch (const std::runtime_error& re) {
      CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
      exit(1);
    }
    const string detachKey = result["detach-key"].as<string>();

    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    PodClient client(socketHandler, socketPath);
    if (!client.connect()) {
      CLOG(INFO, "stdout") << "pod is not running" << endl;
      exit(1);
    }

    int winchPipe[2];
    FATAL_FAIL(::pipe(winchPipe));
    for (int i = 0; i < 2; i++) {
      int opts = fcntl(winchPipe[i], F_GETFL);
      FATAL_FAIL(opts);
      FATAL_FAIL(fcntl(winchPipe[i], F_SETFL, opts | O_NONBLOCK));
    }
    winchWriteFd = winchPipe[1];
    ::signal(SIGWINCH, winchHandler);

    shared_ptr<Console> console(new PseudoTerminalConsole());
    console->setup();
    bool detached = false;
    try {
      detached = client.attach(
          console, detachKey.length() == 1 ? detachKey[0] : 'b', winchPipe[0]);
    } catch (const std::runtime_error& re) {
      console->teardown();
      LOG(ERROR) << "Attach failed: " << re.what();
      CLOG(INFO, "stdout") << endl << "Connection lost: " << re.what() << endl;
      exitCode = 1;
    }
    if (exitCode == 0) {
      console->teardown();
      CLOG(INFO, "stdout") << endl
                           << (detached ? "[detached]" : "[pod exited]")
                           << endl;
    }

    ::signal(SIGWINCH, SIG_DFL);
    winchWriteFd = -1;
    ::close(winchPipe[0]);
    ::close(winchPipe[1]);
    client.close();
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
