#include <cxxopts.hpp>

#include "EventLoop.hpp"
#include "HostConfig.hpp"
#include "HostEnvironment.hpp"
#include "LogHandler.hpp"
#include "PosixProcessSpawner.hpp"
#include "RawConsole.hpp"
#include "SessionChannelBridge.hpp"
#include "SessionHost.hpp"
#include "SocketChannelConnector.hpp"
#include "sole.hpp"

using namespace dx;

namespace {
// Posts keystrokes the way a display process would: as WRITE requests on the
// front-end side of the channel.
void postKeystrokes(SocketChannelConnector* connector,
                    const string& channelId, const string& keys,
                    Scheduler* scheduler) {
  static uint64_t sequence = 0;
  auto port = connector->getFrontEndPeer();
  if (!port || port->isClosed()) {
    LOG(WARNING) << "Dropping input: channel is not open";
    return;
  }
  int64_t timestamp = scheduler->now();
  ChannelRequest request;
  request.set_type(WRITE);
  request.set_terminalid(channelId);
  request.set_timestamp(timestamp);
  request.set_requestid("input-" + channelId + "-" + to_string(timestamp) +
                        "-" + to_string(++sequence));
  request.mutable_data()->set_text(keys);
  try {
    port->post(Packet::fromProto(CHANNEL_REQUEST, request));
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Dropping input: " << ex.what();
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  dx::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, dx::InterruptSignalHandler);
  // Closed channels are reported through read/write errors instead.
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("dxterm", "Terminal session host for DX Engine");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Shell to launch instead of the detected one",
         cxxopts::value<std::string>())  //
        ("cwd", "Working directory for the shell",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("logtostdout", "log to stdout")                      //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "dxterm version " << DX_VERSION << endl;
      exit(0);
    }

    HostConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (cfgfilename.empty()) {
      std::error_code ec;
      string defaultPath = HostConfig::defaultPath();
      if (fs::exists(defaultPath, ec)) {
        cfgfilename = defaultPath;
      }
    }
    if (!cfgfilename.empty()) {
      try {
        config = HostConfig::load(cfgfilename);
      } catch (const std::exception& ex) {
        STFATAL << "Invalid config file " << cfgfilename << ": " << ex.what();
      }
    }

    // Command line wins over the config file.
    if (result.count("shell")) {
      config.shell = result["shell"].as<string>();
    }
    int verbose = result.count("verbose") ? result["verbose"].as<int>()
                                          : config.verbose;
    string logdir = result["logdir"].as<string>();
    if (logdir.empty()) {
      logdir = config.logdir.empty() ? GetTempDirectory() + "dxterm"
                                     : config.logdir;
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    string logPath = LogHandler::setupLogFiles(
        &defaultConf, logdir, "dxterm", result.count("logtostdout") > 0, true,
        true, config.logsize);
    LogHandler::applyDebugSettings(&defaultConf, verbose, config.silent);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("dxterm-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    LOG(INFO) << "dxterm " << DX_VERSION << " logging to " << logPath;

    auto loop = make_shared<EventLoop>();
    auto environment = make_shared<SystemHostEnvironment>();
    LOG(INFO) << "Running on " << hostPlatformName(environment->getPlatform())
              << " as " << environment->getUserName();
    auto spawner = make_shared<PosixProcessSpawner>(loop);
    auto host = make_shared<SessionHost>(spawner, environment, loop, config);
    auto connector = make_shared<SocketChannelConnector>(
        loop, [host](shared_ptr<MessagePort> port) { host->attach(port); });

    string channelId = sole::uuid4().str();
    SessionChannelBridge bridge(channelId, connector, loop, config.reconnect);
    int exitCode = 0;

    bridge.onData([](const string& data) { RawConsole::writeOut(data); });
    bridge.onResponse([&](const ChannelResponse& response) {
      if (!response.success()) {
        LOG(ERROR) << "Request " << response.requestid()
                   << " failed: " << response.error();
        if (response.requestid().rfind("create-", 0) == 0) {
          CLOG(INFO, "stdout") << "Could not start a shell: "
                               << response.error() << "\r" << endl;
          exitCode = 1;
          loop->stop();
        }
        return;
      }
      if (response.has_data() && response.data().has_exitcode()) {
        LOG(INFO) << "Shell exited with code " << response.data().exitcode();
        exitCode = response.data().exitcode();
        loop->stop();
      }
    });
    bridge.onMaxReconnectAttemptsReached([&]() {
      CLOG(INFO, "stdout") << "Lost the session channel.\r" << endl;
      exitCode = 1;
      loop->stop();
    });

    bridge.initialize();

    RawConsole console;
    auto windowSize = console.getWindowSize();
    TerminalCreateOptions createOptions;
    if (result.count("cwd")) {
      createOptions.set_cwd(result["cwd"].as<string>());
    }
    createOptions.set_cols(windowSize.first);
    createOptions.set_rows(windowSize.second);
    bridge.createTerminal(createOptions);

    console.setup();
    loop->watchRead(STDIN_FILENO, [&]() {
      char buf[1024];
      ssize_t bytesRead = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (bytesRead < 0 && (GetErrno() == EINTR || GetErrno() == EAGAIN)) {
        return;
      }
      if (bytesRead <= 0) {
        LOG(INFO) << "Console input closed";
        loop->unwatchRead(STDIN_FILENO);
        bridge.kill();
        return;
      }
      postKeystrokes(connector.get(), channelId, string(buf, bytesRead),
                     loop.get());
    });
    DeferredTask resizeWatch(loop, loop->scheduleRepeating(250, [&]() {
      auto currentSize = console.getWindowSize();
      if (currentSize != windowSize) {
        windowSize = currentSize;
        bridge.resize(windowSize.first, windowSize.second);
      }
    }));

    loop->run();

    resizeWatch.cancel();
    loop->unwatchRead(STDIN_FILENO);
    console.teardown();
    bridge.cleanup();
    host->shutdown();
    // Give killed shells their grace period to be reaped.
    loop->runUntil([&]() { return host->getSessionCount() == 0; },
                   config.timings.killGraceMs + 1000);

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    return exitCode;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& ex) {
    STERROR << "dxterm failed: " << ex.what();
    CLOG(INFO, "stdout") << "dxterm failed: " << ex.what() << endl;
    exit(1);
  }
}
