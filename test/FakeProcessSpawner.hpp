#ifndef __DX_FAKE_PROCESS_SPAWNER_HPP__
#define __DX_FAKE_PROCESS_SPAWNER_HPP__

#include "Headers.hpp"
#include "ProcessSpawner.hpp"

namespace dx {
/**
 * @brief Scripted child: tests push output and exits through it by hand.
 */
class FakeChildProcess : public ChildProcess {
 public:
  FakeChildProcess(pid_t _pid, bool _withStdin, bool _withStdout,
                   bool _withStderr)
      : pid(_pid),
        withStdin(_withStdin),
        withStdout(_withStdout),
        withStderr(_withStderr),
        exited(false) {}

  virtual ~FakeChildProcess() {}

  virtual pid_t getPid() const { return pid; }
  virtual bool hasStdin() const { return withStdin; }
  virtual bool hasStdout() const { return withStdout; }
  virtual bool hasStderr() const { return withStderr; }

  virtual bool writeStdin(const string& data) {
    if (!withStdin || exited) {
      return false;
    }
    stdinData += data;
    return true;
  }

  virtual bool kill(int signum) {
    if (exited) {
      return false;
    }
    signals.push_back(signum);
    if (exitOnSignal.count(signum)) {
      emitExit(0, signum);
    }
    return true;
  }

  virtual bool hasExited() const { return exited; }

  void emitStdout(const string& data) { stdoutEvent.emit(data); }
  void emitStderr(const string& data) { stderrEvent.emit(data); }
  void emitError(const string& error) { errorEvent.emit(error); }
  void emitExit(int code, int signal) {
    exited = true;
    exitEvent.emit(code, signal);
  }

  int countSignal(int signum) const {
    return int(std::count(signals.begin(), signals.end(), signum));
  }

  pid_t pid;
  bool withStdin;
  bool withStdout;
  bool withStderr;
  bool exited;
  string stdinData;
  vector<int> signals;
  /** @brief Signals the child "dies" of as soon as it receives them. */
  set<int> exitOnSignal;
};

class FakeProcessSpawner : public ProcessSpawner {
 public:
  struct SpawnCall {
    string command;
    vector<string> args;
    SpawnOptions options;
  };

  FakeProcessSpawner()
      : failNext(false), omitStdout(false), nextPid(4242) {}

  virtual ~FakeProcessSpawner() {}

  virtual shared_ptr<ChildProcess> spawn(const string& command,
                                         const vector<string>& args,
                                         const SpawnOptions& options) {
    calls.push_back(SpawnCall{command, args, options});
    if (failNext) {
      failNext = false;
      throw std::runtime_error("spawn " + command + " ENOENT");
    }
    auto child =
        make_shared<FakeChildProcess>(nextPid++, true, !omitStdout, true);
    children.push_back(child);
    return child;
  }

  shared_ptr<FakeChildProcess> lastChild() const {
    return children.empty() ? shared_ptr<FakeChildProcess>()
                            : children.back();
  }

  bool failNext;
  bool omitStdout;
  pid_t nextPid;
  vector<SpawnCall> calls;
  vector<shared_ptr<FakeChildProcess>> children;
};
}  // namespace dx

#endif  // __DX_FAKE_PROCESS_SPAWNER_HPP__
