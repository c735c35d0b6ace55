#include "EventLoop.hpp"

namespace dx {
EventLoop::EventLoop() : nextTaskId(1), halt(false) {}

void EventLoop::watchRead(int fd, FdCallback callback) {
  readWatchers[fd] = callback;
}

void EventLoop::watchWrite(int fd, FdCallback callback) {
  writeWatchers[fd] = callback;
}

void EventLoop::unwatchRead(int fd) { readWatchers.erase(fd); }

void EventLoop::unwatchWrite(int fd) { writeWatchers.erase(fd); }

void EventLoop::unwatch(int fd) {
  unwatchRead(fd);
  unwatchWrite(fd);
}

void EventLoop::run() {
  halt = false;
  while (!halt) {
    runOnce(100);
  }
}

bool EventLoop::runUntil(function<bool()> predicate, int64_t timeoutMs) {
  int64_t deadline = steadyNow() + timeoutMs;
  while (!predicate()) {
    int64_t remaining = deadline - steadyNow();
    if (remaining <= 0) {
      return predicate();
    }
    runOnce(std::min<int64_t>(remaining, 10));
  }
  return true;
}

void EventLoop::runOnce(int64_t maxWaitMs) {
  int64_t waitMs = std::max<int64_t>(maxWaitMs, 0);
  int64_t current = steadyNow();
  for (auto& it : timers) {
    waitMs = std::min(waitMs, std::max<int64_t>(it.second.deadline - current, 0));
  }

  fd_set rfds, wfds;
  FD_ZERO(&rfds);
  FD_ZERO(&wfds);
  int maxFd = -1;
  for (auto& it : readWatchers) {
    FD_SET(it.first, &rfds);
    maxFd = max(maxFd, it.first);
  }
  for (auto& it : writeWatchers) {
    FD_SET(it.first, &wfds);
    maxFd = max(maxFd, it.first);
  }
  if (maxFd >= FD_SETSIZE) {
    LOG(FATAL) << "Tried to select() on too many FDs";
  }

  timeval tv;
  tv.tv_sec = waitMs / 1000;
  tv.tv_usec = (waitMs % 1000) * 1000;
  int numFdsSet = select(maxFd + 1, &rfds, &wfds, NULL, &tv);
  if (numFdsSet == -1 && GetErrno() == EINTR) {
    return;
  }
  FATAL_FAIL(numFdsSet);

  if (numFdsSet > 0) {
    // Collect first: callbacks are allowed to add or remove watchers.
    vector<int> readable, writable;
    for (auto& it : readWatchers) {
      if (FD_ISSET(it.first, &rfds)) readable.push_back(it.first);
    }
    for (auto& it : writeWatchers) {
      if (FD_ISSET(it.first, &wfds)) writable.push_back(it.first);
    }
    for (int fd : writable) {
      auto it = writeWatchers.find(fd);
      if (it != writeWatchers.end()) {
        FdCallback callback = it->second;
        dispatch("write watcher", callback);
      }
    }
    for (int fd : readable) {
      auto it = readWatchers.find(fd);
      if (it != readWatchers.end()) {
        FdCallback callback = it->second;
        dispatch("read watcher", callback);
      }
    }
  }

  runDueTimers();
}

void EventLoop::runDueTimers() {
  while (true) {
    int64_t current = steadyNow();
    auto due = timers.end();
    for (auto it = timers.begin(); it != timers.end(); ++it) {
      if (it->second.deadline <= current &&
          (due == timers.end() || it->second.deadline < due->second.deadline)) {
        due = it;
      }
    }
    if (due == timers.end()) {
      return;
    }
    function<void()> task = due->second.task;
    if (due->second.interval > 0) {
      due->second.deadline = current + due->second.interval;
    } else {
      timers.erase(due);
    }
    dispatch("timer", task);
  }
}

void EventLoop::dispatch(const string& what,
                         const function<void()>& callback) {
  try {
    callback();
  } catch (const std::exception& ex) {
    STERROR << "Uncaught exception in " << what << ": " << ex.what();
  }
}

int64_t EventLoop::now() {
  return chrono::duration_cast<chrono::milliseconds>(
             chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t EventLoop::steadyNow() {
  return chrono::duration_cast<chrono::milliseconds>(
             chrono::steady_clock::now().time_since_epoch())
      .count();
}

Scheduler::TaskId EventLoop::schedule(int64_t delayMs, function<void()> task) {
  TaskId id = nextTaskId++;
  timers[id] = Timer{steadyNow() + std::max<int64_t>(delayMs, 0), 0, task};
  return id;
}

Scheduler::TaskId EventLoop::scheduleRepeating(int64_t intervalMs,
                                               function<void()> task) {
  if (intervalMs <= 0) {
    throw std::invalid_argument("Repeating task needs a positive interval");
  }
  TaskId id = nextTaskId++;
  timers[id] = Timer{steadyNow() + intervalMs, intervalMs, task};
  return id;
}

void EventLoop::cancel(TaskId id) { timers.erase(id); }

bool EventLoop::isPending(TaskId id) { return timers.find(id) != timers.end(); }
}  // namespace dx
