#ifndef __DX_EVENT_LOOP__
#define __DX_EVENT_LOOP__

#include "Headers.hpp"
#include "Scheduler.hpp"

namespace dx {
/**
 * @brief select()-driven loop that owns fd watchers and timers.
 *
 * All session, buffer and channel logic runs inside callbacks dispatched from
 * here.  Exceptions thrown by a callback are logged and do not escape the
 * loop.
 */
class EventLoop : public Scheduler {
 public:
  typedef function<void()> FdCallback;

  EventLoop();
  virtual ~EventLoop() {}

  /** @brief Calls @p callback whenever @p fd is readable (or at EOF). */
  void watchRead(int fd, FdCallback callback);
  /** @brief Calls @p callback whenever @p fd is writable. */
  void watchWrite(int fd, FdCallback callback);
  void unwatchRead(int fd);
  void unwatchWrite(int fd);
  /** @brief Removes both read and write interest for @p fd. */
  void unwatch(int fd);

  /** @brief Dispatches events until stop() is called. */
  void run();
  /** @brief Waits at most @p maxWaitMs for one round of events. */
  void runOnce(int64_t maxWaitMs);
  /**
   * @brief Runs until @p predicate holds or @p timeoutMs elapses.
   * @return The final value of the predicate.
   */
  bool runUntil(function<bool()> predicate, int64_t timeoutMs);
  void stop() { halt = true; }
  bool isStopped() const { return halt; }

  virtual int64_t now();
  virtual TaskId schedule(int64_t delayMs, function<void()> task);
  virtual TaskId scheduleRepeating(int64_t intervalMs, function<void()> task);
  virtual void cancel(TaskId id);
  virtual bool isPending(TaskId id);

 protected:
  struct Timer {
    int64_t deadline;
    int64_t interval;
    function<void()> task;
  };

  int64_t steadyNow();
  void runDueTimers();
  void dispatch(const string& what, const function<void()>& callback);

  map<int, FdCallback> readWatchers;
  map<int, FdCallback> writeWatchers;
  map<TaskId, Timer> timers;
  TaskId nextTaskId;
  bool halt;
};
}  // namespace dx

#endif  // __DX_EVENT_LOOP__
