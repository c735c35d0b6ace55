#include "PosixProcessSpawner.hpp"

extern char** environ;

namespace dx {
namespace {
void setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

void closePipe(int* fds) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] >= 0) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
}

// The parent's environment with @p overrides applied, as NAME=value strings.
vector<string> buildEnvironment(const map<string, string>& overrides) {
  vector<string> result;
  for (char** entry = environ; entry && *entry; ++entry) {
    string assignment(*entry);
    auto equals = assignment.find('=');
    string name = assignment.substr(0, equals);
    if (overrides.find(name) == overrides.end()) {
      result.push_back(assignment);
    }
  }
  for (auto& it : overrides) {
    result.push_back(it.first + "=" + it.second);
  }
  return result;
}

// Only async-signal-safe calls from here on: we are in the forked child.
void reportChildFailure(int statusFd) {
  int childErrno = errno;
  ssize_t ignored = ::write(statusFd, &childErrno, sizeof(childErrno));
  (void)ignored;
  _exit(127);
}
}  // namespace

PosixChildProcess::PosixChildProcess(shared_ptr<EventLoop> _loop, pid_t _pid,
                                     int _stdinFd, int _stdoutFd,
                                     int _stderrFd)
    : loop(_loop),
      pid(_pid),
      stdinFd(_stdinFd),
      stdoutFd(_stdoutFd),
      stderrFd(_stderrFd),
      exited(false) {}

PosixChildProcess::~PosixChildProcess() {
  if (!exited) {
    ::waitpid(pid, NULL, WNOHANG);
  }
  closeFd(&stdinFd);
  closeFd(&stdoutFd);
  closeFd(&stderrFd);
}

void PosixChildProcess::start() {
  setNonBlocking(stdinFd);
  setNonBlocking(stdoutFd);
  setNonBlocking(stderrFd);
  loop->watchRead(stdoutFd, [this]() {
    if (readPipe(&stdoutFd, false) < 0) closeFd(&stdoutFd);
  });
  loop->watchRead(stderrFd, [this]() {
    if (readPipe(&stderrFd, true) < 0) closeFd(&stderrFd);
  });
  reaper = DeferredTask(loop, loop->scheduleRepeating(REAP_INTERVAL_MS,
                                                      [this]() { reap(); }));
}

ssize_t PosixChildProcess::readPipe(int* fd, bool isStderr) {
  auto self = shared_from_this();
  char buf[4096];
  ssize_t bytesRead = ::read(*fd, buf, sizeof(buf));
  if (bytesRead > 0) {
    string data(buf, bytesRead);
    if (isStderr) {
      stderrEvent.emit(data);
    } else {
      stdoutEvent.emit(data);
    }
    return bytesRead;
  }
  if (bytesRead < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return 0;
    }
    LOG(WARNING) << "Reading from child " << pid
                 << " failed: " << strerror(localErrno);
  }
  return -1;
}

void PosixChildProcess::closeFd(int* fd) {
  if (*fd >= 0) {
    loop->unwatch(*fd);
    ::close(*fd);
    *fd = -1;
  }
}

bool PosixChildProcess::writeStdin(const string& data) {
  if (stdinFd < 0 || exited) {
    return false;
  }
  if (!stdinBuffer.canAcceptMore()) {
    LOG(WARNING) << "Stdin buffer of child " << pid << " is full";
    return false;
  }
  stdinBuffer.enqueue(data);
  flushStdin();
  return stdinFd >= 0;
}

void PosixChildProcess::flushStdin() {
  if (stdinFd < 0) {
    return;
  }
  if (!stdinBuffer.writeTo(stdinFd)) {
    LOG(WARNING) << "Writing to child " << pid
                 << " failed: " << strerror(GetErrno());
    stdinBuffer.clear();
    closeFd(&stdinFd);
    return;
  }
  if (stdinBuffer.hasPendingData()) {
    loop->watchWrite(stdinFd, [this]() { flushStdin(); });
  } else {
    loop->unwatchWrite(stdinFd);
  }
}

bool PosixChildProcess::kill(int signum) {
  if (exited) {
    return false;
  }
  if (::kill(pid, signum) == -1) {
    LOG(WARNING) << "kill(" << pid << ", " << signum
                 << ") failed: " << strerror(GetErrno());
    return false;
  }
  return true;
}

void PosixChildProcess::reap() {
  if (exited) {
    return;
  }
  int status = 0;
  pid_t result = ::waitpid(pid, &status, WNOHANG);
  if (result == 0) {
    return;
  }
  if (result == -1 && GetErrno() == EINTR) {
    return;
  }
  auto self = shared_from_this();
  exited = true;
  reaper.cancel();

  // Whatever the child wrote before exiting is still in the pipes.
  while (stdoutFd >= 0 && readPipe(&stdoutFd, false) > 0) {
  }
  while (stderrFd >= 0 && readPipe(&stderrFd, true) > 0) {
  }
  closeFd(&stdinFd);
  closeFd(&stdoutFd);
  closeFd(&stderrFd);
  stdinBuffer.clear();

  int exitCode = 0;
  int signal = 0;
  if (result == -1) {
    string error = string("waitpid failed: ") + strerror(GetErrno());
    LOG(ERROR) << "Child " << pid << ": " << error;
    errorEvent.emit(error);
    exitCode = -1;
  } else if (WIFSIGNALED(status)) {
    signal = WTERMSIG(status);
  } else if (WIFEXITED(status)) {
    exitCode = WEXITSTATUS(status);
  }
  VLOG(1) << "Child " << pid << " exited with code " << exitCode
          << " signal " << signal;
  exitEvent.emit(exitCode, signal);
}

shared_ptr<ChildProcess> PosixProcessSpawner::spawn(
    const string& command, const vector<string>& args,
    const SpawnOptions& options) {
  int stdinPipe[2] = {-1, -1};
  int stdoutPipe[2] = {-1, -1};
  int stderrPipe[2] = {-1, -1};
  int statusPipe[2] = {-1, -1};
  if (::pipe(stdinPipe) == -1 || ::pipe(stdoutPipe) == -1 ||
      ::pipe(stderrPipe) == -1 || ::pipe(statusPipe) == -1) {
    string error = strerror(GetErrno());
    closePipe(stdinPipe);
    closePipe(stdoutPipe);
    closePipe(stderrPipe);
    closePipe(statusPipe);
    throw std::runtime_error("Could not create pipes: " + error);
  }
  // No pipe end may leak into later children.  dup2() clears the flag on the
  // child's stdio.
  for (int* fds : {stdinPipe, stdoutPipe, stderrPipe, statusPipe}) {
    setCloseOnExec(fds[0]);
    setCloseOnExec(fds[1]);
  }

  // Everything the child needs is built before fork().
  vector<string> argvStrings;
  argvStrings.push_back(command);
  argvStrings.insert(argvStrings.end(), args.begin(), args.end());
  vector<char*> argv;
  for (auto& arg : argvStrings) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(NULL);
  vector<string> envStrings = buildEnvironment(options.env);
  vector<char*> envp;
  for (auto& assignment : envStrings) {
    envp.push_back(&assignment[0]);
  }
  envp.push_back(NULL);

  pid_t pid = fork();
  if (pid == -1) {
    string error = strerror(GetErrno());
    closePipe(stdinPipe);
    closePipe(stdoutPipe);
    closePipe(stderrPipe);
    closePipe(statusPipe);
    throw std::runtime_error("fork failed: " + error);
  }

  if (pid == 0) {
    // child process
    ::close(statusPipe[0]);
    if (::dup2(stdinPipe[0], STDIN_FILENO) == -1 ||
        ::dup2(stdoutPipe[1], STDOUT_FILENO) == -1 ||
        ::dup2(stderrPipe[1], STDERR_FILENO) == -1) {
      reportChildFailure(statusPipe[1]);
    }
    ::close(stdinPipe[0]);
    ::close(stdinPipe[1]);
    ::close(stdoutPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[0]);
    ::close(stderrPipe[1]);
    if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) == -1) {
      reportChildFailure(statusPipe[1]);
    }
    environ = &envp[0];
    // Shells remember the inherited dispositions; hand them the defaults.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    ::execvp(command.c_str(), &argv[0]);
    reportChildFailure(statusPipe[1]);
  }

  // parent process
  ::close(stdinPipe[0]);
  ::close(stdoutPipe[1]);
  ::close(stderrPipe[1]);
  ::close(statusPipe[1]);

  int childErrno = 0;
  ssize_t statusBytes;
  do {
    statusBytes = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
  } while (statusBytes == -1 && GetErrno() == EINTR);
  ::close(statusPipe[0]);

  if (statusBytes == ssize_t(sizeof(childErrno))) {
    int status;
    while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
    ::close(stdinPipe[1]);
    ::close(stdoutPipe[0]);
    ::close(stderrPipe[0]);
    throw std::runtime_error("Failed to launch " + command + ": " +
                             strerror(childErrno));
  }

  LOG(INFO) << "Launched " << command << " as pid " << pid;
  auto child = make_shared<PosixChildProcess>(loop, pid, stdinPipe[1],
                                              stdoutPipe[0], stderrPipe[0]);
  child->start();
  return child;
}
}  // namespace dx
