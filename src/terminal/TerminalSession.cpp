#include "TerminalSession.hpp"

#include "TerminalOutputFilter.hpp"

namespace dx {
string sessionStateName(SessionState state) {
  switch (state) {
    case SESSION_IDLE:
      return "idle";
    case SESSION_RUNNING:
      return "running";
    case SESSION_TERMINATING:
      return "terminating";
    case SESSION_EXITED:
      return "exited";
  }
  return "unknown";
}

TerminalSession::TerminalSession(const string& _id,
                                 const TerminalSessionOptions& options,
                                 shared_ptr<ProcessSpawner> _spawner,
                                 shared_ptr<HostEnvironment> _environment,
                                 shared_ptr<Scheduler> _scheduler,
                                 const BufferConfig& bufferConfig,
                                 const SessionTimings& _timings)
    : id(_id),
      env(options.env),
      cols(options.cols.value_or(DEFAULT_COLS)),
      rows(options.rows.value_or(DEFAULT_ROWS)),
      state(SESSION_IDLE),
      exitSignal(0),
      spawner(_spawner),
      environment(_environment),
      scheduler(_scheduler),
      timings(_timings) {
  if (id.empty()) {
    throw std::invalid_argument("Terminal session id must not be empty");
  }
  if (cols <= 0 || rows <= 0) {
    throw std::invalid_argument("Terminal geometry must be positive, got " +
                                to_string(cols) + "x" + to_string(rows));
  }
  if (!spawner || !environment || !scheduler) {
    throw std::invalid_argument("Terminal session is missing a collaborator");
  }
  name = (options.name && !options.name->empty()) ? *options.name : id;
  shell = (options.shell && !options.shell->empty())
              ? *options.shell
              : detectShell(*environment);
  cwd = (options.cwd && !options.cwd->empty()) ? *options.cwd
                                               : environment->getCwd();
  createdAt = scheduler->now();

  buffer.reset(new OutputBufferManager(bufferConfig, scheduler));
  buffer->onDataReady([this](const string& data) { dataEvent.emit(data); });
  buffer->onChunksDropped([this](const DropReport& report) {
    LOG(WARNING) << "Terminal " << id << " dropped " << report.droppedCount
                 << " output chunks under load";
  });
}

TerminalSession::~TerminalSession() {
  if (child) {
    child->clearHandlers();
    if (!child->hasExited() &&
        (state == SESSION_RUNNING || state == SESSION_TERMINATING)) {
      LOG(INFO) << "Terminal " << id << " destroyed with a live child";
      child->kill(SIGKILL);
    }
  }
}

string TerminalSession::detectShell(const HostEnvironment& environment) {
  switch (environment.getPlatform()) {
    case PLATFORM_WINDOWS: {
      auto comspec = environment.getEnv("COMSPEC");
      if (comspec && toLower(*comspec).find("powershell") != string::npos) {
        return "powershell.exe";
      }
      if (comspec && !comspec->empty()) {
        return *comspec;
      }
      return "cmd.exe";
    }
    case PLATFORM_MACOS: {
      auto loginShell = environment.getEnv("SHELL");
      if (loginShell && !loginShell->empty()) {
        return *loginShell;
      }
      return "/bin/zsh";
    }
    default: {
      auto loginShell = environment.getEnv("SHELL");
      if (loginShell && !loginShell->empty()) {
        return *loginShell;
      }
      return "/bin/bash";
    }
  }
}

void TerminalSession::spawn() {
  if (state != SESSION_IDLE) {
    LOG(WARNING) << "Terminal " << id << " is already "
                 << sessionStateName(state) << ", not spawning again";
    return;
  }

  SpawnOptions spawnOptions;
  spawnOptions.cwd = cwd;
  spawnOptions.env = env;
  spawnOptions.env["TERM"] = "xterm-256color";
  spawnOptions.env["COLORTERM"] = "truecolor";
  spawnOptions.env["COLUMNS"] = to_string(cols);
  spawnOptions.env["LINES"] = to_string(rows);

  LOG(INFO) << "Terminal " << id << " spawning " << shell << " in " << cwd;
  shared_ptr<ChildProcess> launched;
  try {
    launched = spawner->spawn(shell, {}, spawnOptions);
  } catch (const std::runtime_error& ex) {
    reportError(string("Failed to spawn terminal: ") + ex.what());
    return;
  }

  if (!launched->hasStdout() || !launched->hasStderr()) {
    launched->kill(SIGKILL);
    reportError("Failed to create stdio streams");
    return;
  }

  child = launched;
  pid = child->getPid();
  state = SESSION_RUNNING;

  child->onStdout(
      [this](const string& data) { handleOutput(data, OUTPUT_STDOUT); });
  child->onStderr(
      [this](const string& data) { handleOutput(data, OUTPUT_STDERR); });
  child->onError([this](const string& message) { reportError(message); });
  child->onExit([this](int code, int signal) { handleExit(code, signal); });

  promptTask = DeferredTask(
      scheduler,
      scheduler->schedule(timings.promptDelayMs, [this]() { emitPrompt(); }));
  healthTask = DeferredTask(
      scheduler, scheduler->scheduleRepeating(timings.healthIntervalMs,
                                              [this]() { logHealth(); }));
}

void TerminalSession::handleOutput(const string& raw, OutputSource source) {
  VLOG(2) << "Terminal " << id << " raw "
          << (source == OUTPUT_STDERR ? "stderr" : "stdout") << " ("
          << raw.length() << " bytes): " << previewForLog(raw);
  string filtered = filterTerminalOutput(raw);
  if (trim(filtered).empty()) {
    VLOG(1) << "Terminal " << id << " output was filtered out entirely";
    return;
  }
  buffer->write(filtered, source);
}

void TerminalSession::handleExit(int code, int signal) {
  if (state == SESSION_EXITED) {
    return;
  }
  LOG(INFO) << "Terminal " << id << " exited with code " << code
            << ", signal " << signal;
  state = SESSION_EXITED;
  exitCode = (signal != 0) ? 0 : code;
  exitSignal = signal;
  escalationTask.cancel();
  promptTask.cancel();
  healthTask.cancel();
  buffer->drain();
  buffer->destroy();
  exitEvent.emit(*exitCode, exitSignal);
}

void TerminalSession::emitPrompt() {
  if (state != SESSION_RUNNING) {
    return;
  }
  VLOG(1) << "Sending initial prompt for " << id;
  dataEvent.emit(string("\r\nWelcome to ") + DX_PRODUCT_NAME + " Terminal\r\n" +
                 environment->getUserName() + "@" +
                 environment->getHostName() + ":" + cwd + "$ ");
}

void TerminalSession::logHealth() {
  try {
    auto metrics = buffer->getMetrics();
    auto health = buffer->getHealthStatus();
    LOG(INFO) << "Terminal " << id << " is " << sessionStateName(state)
              << " with pid " << (pid ? to_string(*pid) : string("none"))
              << ", " << metrics.totalBytes << " bytes in, "
              << metrics.pendingChunks << " chunks pending"
              << (health.isHealthy ? "" : ", buffer unhealthy");
    for (auto& warning : health.warnings) {
      LOG(WARNING) << "Terminal " << id << ": " << warning;
    }
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Health check for " << id << " failed: " << ex.what();
  }
}

void TerminalSession::reportError(const string& message) {
  LOG(ERROR) << "Terminal " << id << ": " << message;
  errorEvent.emit(message);
}

void TerminalSession::write(const string& data) {
  if (state != SESSION_RUNNING || !child || !child->hasStdin()) {
    LOG(ERROR) << "Cannot write to terminal " << id
               << ": no running process with stdin";
    return;
  }
  VLOG(1) << "Terminal " << id << " input: " << previewForLog(data);

  // Pipes give the shell no tty, so echo is done here.
  string echo;
  string forward;
  for (char c : data) {
    if (c == '\r') {
      echo += "\r\n";
      forward += '\n';
    } else if (c == '\b' || c == '\x7f') {
      echo += "\b \b";
    } else {
      echo += c;
      forward += c;
    }
  }
  if (!echo.empty()) {
    dataEvent.emit(echo);
  }
  if (!forward.empty() && !child->writeStdin(forward)) {
    LOG(WARNING) << "Terminal " << id << " could not forward input";
  }
}

void TerminalSession::resize(int newCols, int newRows) {
  if (newCols <= 0 || newRows <= 0) {
    LOG(WARNING) << "Ignoring resize of " << id << " to " << newCols << "x"
                 << newRows;
    return;
  }
  cols = newCols;
  rows = newRows;
  if (state != SESSION_RUNNING || !child) {
    return;
  }
  if (environment->getPlatform() == PLATFORM_WINDOWS) {
    return;
  }
  if (!child->kill(SIGWINCH)) {
    LOG(WARNING) << "Failed to signal resize to terminal " << id;
  }
}

void TerminalSession::kill() {
  if (state != SESSION_RUNNING || !child) {
    VLOG(1) << "Terminal " << id << " is not running, nothing to kill";
    return;
  }
  LOG(INFO) << "Killing terminal " << id;
  buffer->destroy();
  promptTask.cancel();
  state = SESSION_TERMINATING;
  if (!child->kill(SIGTERM)) {
    LOG(WARNING) << "SIGTERM to terminal " << id << " failed";
  }
  if (state != SESSION_TERMINATING) {
    return;
  }
  escalationTask = DeferredTask(
      scheduler, scheduler->schedule(timings.killGraceMs, [this]() {
        if (state == SESSION_TERMINATING && child && !child->hasExited()) {
          LOG(WARNING) << "Force killing terminal " << id;
          child->kill(SIGKILL);
        }
      }));
}
}  // namespace dx
