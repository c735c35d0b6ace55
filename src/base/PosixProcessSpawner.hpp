#ifndef __DX_POSIX_PROCESS_SPAWNER__
#define __DX_POSIX_PROCESS_SPAWNER__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "ProcessSpawner.hpp"
#include "Scheduler.hpp"
#include "WriteBuffer.hpp"

namespace dx {
/**
 * @brief Child launched with fork/execvp, its pipes serviced by an EventLoop.
 */
class PosixChildProcess : public ChildProcess,
                          public enable_shared_from_this<PosixChildProcess> {
 public:
  /** @brief How often the child is polled with waitpid(WNOHANG). */
  static constexpr int64_t REAP_INTERVAL_MS = 50;

  PosixChildProcess(shared_ptr<EventLoop> _loop, pid_t _pid, int _stdinFd,
                    int _stdoutFd, int _stderrFd);
  virtual ~PosixChildProcess();

  /** @brief Registers the pipes and the reaper with the loop. */
  void start();

  virtual pid_t getPid() const { return pid; }
  virtual bool hasStdin() const { return stdinFd >= 0; }
  virtual bool hasStdout() const { return stdoutFd >= 0; }
  virtual bool hasStderr() const { return stderrFd >= 0; }
  virtual bool writeStdin(const string& data);
  virtual bool kill(int signum);
  virtual bool hasExited() const { return exited; }

 protected:
  /** @return Bytes read, 0 when nothing is ready, -1 at EOF or on error. */
  ssize_t readPipe(int* fd, bool isStderr);
  void flushStdin();
  void closeFd(int* fd);
  void reap();

  shared_ptr<EventLoop> loop;
  pid_t pid;
  int stdinFd;
  int stdoutFd;
  int stderrFd;
  WriteBuffer stdinBuffer;
  DeferredTask reaper;
  bool exited;
};

class PosixProcessSpawner : public ProcessSpawner {
 public:
  explicit PosixProcessSpawner(shared_ptr<EventLoop> _loop) : loop(_loop) {}
  virtual ~PosixProcessSpawner() {}

  virtual shared_ptr<ChildProcess> spawn(const string& command,
                                         const vector<string>& args,
                                         const SpawnOptions& options);

 protected:
  shared_ptr<EventLoop> loop;
};
}  // namespace dx

#endif  // __DX_POSIX_PROCESS_SPAWNER__
