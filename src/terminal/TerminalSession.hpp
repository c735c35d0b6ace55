#ifndef __DX_TERMINAL_SESSION__
#define __DX_TERMINAL_SESSION__

#include "EventSignal.hpp"
#include "Headers.hpp"
#include "HostEnvironment.hpp"
#include "OutputBufferManager.hpp"
#include "ProcessSpawner.hpp"
#include "Scheduler.hpp"

namespace dx {
enum SessionState {
  SESSION_IDLE = 0,
  SESSION_RUNNING = 1,
  SESSION_TERMINATING = 2,
  SESSION_EXITED = 3,
};

string sessionStateName(SessionState state);

struct TerminalSessionOptions {
  optional<string> name;
  optional<string> shell;
  optional<string> cwd;
  map<string, string> env;
  optional<int> cols;
  optional<int> rows;
};

/**
 * @brief Delays used by a session's timers.
 */
struct SessionTimings {
  int64_t promptDelayMs = 500;
  int64_t healthIntervalMs = 10000;
  int64_t killGraceMs = 5000;
};

/**
 * @brief One interactive shell child and the buffer its output flows through.
 *
 * Output from the child is filtered, coalesced by an OutputBufferManager and
 * published on the data event.  The session is IDLE until spawn() succeeds,
 * RUNNING until kill() or the child exits, and keeps its last-known pid and
 * exit status once EXITED.
 */
class TerminalSession {
 public:
  typedef function<void(const string&)> DataHandler;
  typedef function<void(const string&)> ErrorHandler;
  typedef function<void(int, int)> ExitHandler;

  static constexpr int DEFAULT_COLS = 80;
  static constexpr int DEFAULT_ROWS = 24;

  /**
   * @throws std::invalid_argument for an empty id, non-positive geometry or
   * an invalid buffer configuration.
   */
  TerminalSession(const string& _id, const TerminalSessionOptions& options,
                  shared_ptr<ProcessSpawner> _spawner,
                  shared_ptr<HostEnvironment> _environment,
                  shared_ptr<Scheduler> _scheduler,
                  const BufferConfig& bufferConfig =
                      BufferConfig::sessionDefaults(),
                  const SessionTimings& _timings = SessionTimings());
  ~TerminalSession();

  /**
   * @brief Picks a shell for @p environment when none was requested.
   *
   * Windows prefers powershell.exe when COMSPEC mentions PowerShell, then
   * COMSPEC, then cmd.exe.  macOS uses SHELL or /bin/zsh, other platforms
   * SHELL or /bin/bash.
   */
  static string detectShell(const HostEnvironment& environment);

  /** @brief Launches the shell.  Failures are reported on the error event. */
  void spawn();
  /** @brief Echoes and forwards keyboard input to the shell. */
  void write(const string& data);
  void resize(int newCols, int newRows);
  /** @brief SIGTERM now, SIGKILL after the grace period if still alive. */
  void kill();

  const string& getId() const { return id; }
  const string& getName() const { return name; }
  const string& getShell() const { return shell; }
  const string& getCwd() const { return cwd; }
  int getCols() const { return cols; }
  int getRows() const { return rows; }
  int64_t getCreatedAt() const { return createdAt; }
  SessionState getState() const { return state; }
  bool isRunning() const { return state == SESSION_RUNNING; }
  optional<pid_t> getPid() const { return pid; }
  optional<int> getExitCode() const { return exitCode; }
  int getExitSignal() const { return exitSignal; }

  BufferMetrics getBufferMetrics() const { return buffer->getMetrics(); }
  BufferHealth getBufferHealth() const { return buffer->getHealthStatus(); }
  void pauseBuffer() { buffer->pause(); }
  void resumeBuffer() { buffer->resume(); }

  void onData(const DataHandler& handler) { dataEvent.connect(handler); }
  void onError(const ErrorHandler& handler) { errorEvent.connect(handler); }
  void onExit(const ExitHandler& handler) { exitEvent.connect(handler); }

 protected:
  void handleOutput(const string& raw, OutputSource source);
  void handleExit(int code, int signal);
  void emitPrompt();
  void logHealth();
  void reportError(const string& message);

  string id;
  string name;
  string shell;
  string cwd;
  map<string, string> env;
  int cols;
  int rows;
  int64_t createdAt;
  SessionState state;
  optional<pid_t> pid;
  optional<int> exitCode;
  int exitSignal;

  shared_ptr<ProcessSpawner> spawner;
  shared_ptr<HostEnvironment> environment;
  shared_ptr<Scheduler> scheduler;
  SessionTimings timings;
  unique_ptr<OutputBufferManager> buffer;
  shared_ptr<ChildProcess> child;

  DeferredTask promptTask;
  DeferredTask healthTask;
  DeferredTask escalationTask;

  EventSignal<const string&> dataEvent;
  EventSignal<const string&> errorEvent;
  EventSignal<int, int> exitEvent;
};
}  // namespace dx

#endif  // __DX_TERMINAL_SESSION__
