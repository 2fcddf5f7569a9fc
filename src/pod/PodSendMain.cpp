#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "PodClient.hpp"
#include "PodConfig.hpp"

using namespace tpod;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tpod::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tpod-send", "Types text into a running pod");
  try {
    options.positional_help("[text...]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("uuid", "Pane identifier of the pod",
         cxxopts::value<std::string>()->default_value(""))  //
        ("name", "Name of the pod (newest match wins)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("socket", "Socket path of the pod",
         cxxopts::value<std::string>()->default_value(""))  //
        ("enter", "Append a newline")                       //
        ("ctrl", "Send Ctrl+<letter> instead of text",
         cxxopts::value<std::string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("text", "Text to send", cxxopts::value<vector<string>>())  //
        ;
    options.parse_positional({"text"});

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tpod-send version " << TPOD_VERSION << endl;
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
                              "tpod-send", result.count("logtostdout") > 0,
                              false, true, config.maxLogSize);
    el::Loggers::reconfigureLogger("default", defaultConf);

    string text;
    if (result.count("text")) {
      const auto& words = result["text"].as<vector<string>>();
      for (size_t i = 0; i < words.size(); i++) {
        if (i) {
          text += " ";
        }
        text += words[i];
      }
    }

    string payload;
    string socketPath;
    try {
      payload = PodClient::buildSendPayload(text, result["ctrl"].as<string>(),
                                            result.count("enter") > 0);
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

    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    PodClient client(socketHandler, socketPath);
    if (!client.connect()) {
      CLOG(INFO, "stdout") << "pod is not running" << endl;
      exit(1);
    }
    try {
      client.sendInput(payload);
    } catch (const std::runtime_error& re) {
      CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
      exit(1);
    }
    VLOG(1) << "Sent " << payload.length() << " bytes to " << socketPath;
    client.close();
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
  return 0;
}
