#include "PipeSocketHandler.hpp"
#include "PodClient.hpp"
#include "PodServer.hpp"
#include "PseudoPodTerminal.hpp"
#include "TestEnvironment.hpp"
#include "TestHeaders.hpp"

using namespace tpod;

namespace {
const string TEST_UUID = "00112233445566778899aabbccddeeff";

string readUntil(PodTerminal* terminal, const string& needle) {
  string output;
  for (int i = 0; i < 100 && output.find(needle) == string::npos; i++) {
    pollfd pfd;
    pfd.fd = terminal->getFd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (::poll(&pfd, 1, 50) <= 0) {
      continue;
    }
    char buf[1024];
    ssize_t n = terminal->read(buf, sizeof(buf));
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
      continue;
    }
    if (n <= 0) {
      // EIO once the child side is gone.
      break;
    }
    output.append(buf, n);
  }
  return output;
}
}  // namespace

TEST_CASE("Child environment", "[PseudoPodTerminal][integration]") {
  TestEnvironment env;
  const string cwd = env.createTempDir();
  const string dirName = fs::path(cwd).filename().string();

  PseudoPodTerminal terminal;
  map<string, string> extraEnv = {{"TPOD_POD_NAME", "demo"},
                                  {"TPOD_PANE_UUID", TEST_UUID}};
  terminal.setup(
      "echo \"T=$TPOD N=$TPOD_POD_NAME U=$TPOD_PANE_UUID TERM=$TERM\"; pwd",
      cwd, extraEnv);
  REQUIRE(terminal.getFd() >= 0);
  REQUIRE(terminal.getPid() > 0);

  string output = readUntil(&terminal, dirName);
  INFO("output = " << output);
  REQUIRE(output.find("T=1 N=demo U=" + TEST_UUID + " TERM=xterm-256color") !=
          string::npos);
  REQUIRE(output.find(dirName) != string::npos);

  bool exited = false;
  for (int i = 0; i < 100 && !exited; i++) {
    exited = terminal.pollExited();
    if (!exited) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  REQUIRE(exited);
}

TEST_CASE("Interactive child", "[PseudoPodTerminal][integration]") {
  PseudoPodTerminal terminal;
  terminal.setup("/bin/cat", "", {});

  const string line = "hello pty\n";
  REQUIRE(terminal.write(line.data(), line.length()) ==
          ssize_t(line.length()));
  REQUIRE(readUntil(&terminal, "hello pty").find("hello pty") !=
          string::npos);

  terminal.setSize(132, 43);
  winsize win;
  REQUIRE(ioctl(terminal.getFd(), TIOCGWINSZ, &win) == 0);
  REQUIRE(win.ws_col == 132);
  REQUIRE(win.ws_row == 43);

  REQUIRE(!terminal.pollExited());
  terminal.cleanup();
  REQUIRE(terminal.pollExited());
  // Cleaning up twice is harmless.
  terminal.cleanup();
}

TEST_CASE("Pod with a real pty", "[PodServer][integration]") {
  TestEnvironment env;
  const string socketPath = env.createTempDir() + "/pod.sock";
  SocketEndpoint endpoint;
  endpoint.set_name(socketPath);

  auto terminal = make_shared<PseudoPodTerminal>();
  terminal->setup("/bin/cat", "", {});
  PodServer server(make_shared<PipeSocketHandler>(), endpoint, terminal,
                   TEST_UUID);

  PodClient client(make_shared<PipeSocketHandler>(), socketPath);
  REQUIRE(client.connect());
  REQUIRE(server.iterate(100));
  REQUIRE(server.hasClient());

  client.sendInput("ping\n");
  string output;
  for (int i = 0; i < 100 && output.find("ping") == string::npos; i++) {
    REQUIRE(server.iterate(50));
    for (const auto& frame : client.readFrames(10)) {
      if (frame.getHeader() == FRAME_OUTPUT) {
        output += frame.getPayload();
      }
    }
  }
  REQUIRE(output.find("ping") != string::npos);

  // Ctrl+D at the start of a line ends cat.
  client.sendInput("\x04");
  bool running = true;
  for (int i = 0; i < 100 && running; i++) {
    running = server.iterate(50);
  }
  REQUIRE(!running);
}
