#ifndef __DX_PROCESS_SPAWNER__
#define __DX_PROCESS_SPAWNER__

#include "EventSignal.hpp"
#include "Headers.hpp"

namespace dx {
struct SpawnOptions {
  /** @brief Working directory for the child; empty keeps the parent's. */
  string cwd;
  /** @brief Variables set on top of the inherited environment. */
  map<string, string> env;
};

/**
 * @brief Handle to a launched child with piped stdio.
 *
 * Output arrives through the stdout/stderr events.  The exit event fires once
 * with (exitCode, signal): signal is 0 for a normal exit and exitCode is 0
 * whenever the child was killed by a signal.
 */
class ChildProcess {
 public:
  typedef function<void(const string&)> DataHandler;
  typedef function<void(const string&)> ErrorHandler;
  typedef function<void(int, int)> ExitHandler;

  virtual ~ChildProcess() {}

  virtual pid_t getPid() const = 0;
  virtual bool hasStdin() const = 0;
  virtual bool hasStdout() const = 0;
  virtual bool hasStderr() const = 0;
  /** @brief Queues bytes for the child's stdin; false if it is not writable. */
  virtual bool writeStdin(const string& data) = 0;
  /** @brief Delivers @p signum; false if the child is gone or kill failed. */
  virtual bool kill(int signum) = 0;
  virtual bool hasExited() const = 0;

  void onStdout(const DataHandler& handler) { stdoutEvent.connect(handler); }
  void onStderr(const DataHandler& handler) { stderrEvent.connect(handler); }
  void onError(const ErrorHandler& handler) { errorEvent.connect(handler); }
  void onExit(const ExitHandler& handler) { exitEvent.connect(handler); }

  void clearHandlers() {
    stdoutEvent.disconnectAll();
    stderrEvent.disconnectAll();
    errorEvent.disconnectAll();
    exitEvent.disconnectAll();
  }

 protected:
  EventSignal<const string&> stdoutEvent;
  EventSignal<const string&> stderrEvent;
  EventSignal<const string&> errorEvent;
  EventSignal<int, int> exitEvent;
};

class ProcessSpawner {
 public:
  virtual ~ProcessSpawner() {}

  /**
   * @brief Launches @p command with @p args and all stdio piped.
   * @throws std::runtime_error when the child cannot be started.
   */
  virtual shared_ptr<ChildProcess> spawn(const string& command,
                                         const vector<string>& args,
                                         const SpawnOptions& options) = 0;
};
}  // namespace dx

#endif  // __DX_PROCESS_SPAWNER__
