#ifndef __DX_SCHEDULER__
#define __DX_SCHEDULER__

#include "Headers.hpp"

namespace dx {
/**
 * @brief Source of time and deferred work for the single-threaded components.
 *
 * Every timer in the system (flush interval, prompt, health tick, kill
 * escalation, reconnect backoff) goes through this interface so tests can
 * drive time by hand.
 */
class Scheduler {
 public:
  typedef uint64_t TaskId;
  static constexpr TaskId INVALID_TASK = 0;

  virtual ~Scheduler() {}

  /** @brief Wall-clock time in milliseconds since the epoch. */
  virtual int64_t now() = 0;
  /** @brief Runs @p task once, @p delayMs from now. */
  virtual TaskId schedule(int64_t delayMs, function<void()> task) = 0;
  /** @brief Runs @p task every @p intervalMs until cancelled. */
  virtual TaskId scheduleRepeating(int64_t intervalMs,
                                   function<void()> task) = 0;
  /** @brief Cancels a task.  Unknown or finished ids are ignored. */
  virtual void cancel(TaskId id) = 0;
  /** @brief True while the task is still going to run. */
  virtual bool isPending(TaskId id) = 0;
};

/**
 * @brief Move-only handle that owns one scheduled task.
 *
 * The task is cancelled when the handle is cancelled, reassigned or destroyed,
 * so a component that owns its handles never gets called back after it dies.
 */
class DeferredTask {
 public:
  DeferredTask() : id(Scheduler::INVALID_TASK) {}

  DeferredTask(shared_ptr<Scheduler> _scheduler, Scheduler::TaskId _id)
      : scheduler(_scheduler), id(_id) {}

  DeferredTask(const DeferredTask&) = delete;
  DeferredTask& operator=(const DeferredTask&) = delete;

  DeferredTask(DeferredTask&& other) noexcept
      : scheduler(std::move(other.scheduler)), id(other.id) {
    other.id = Scheduler::INVALID_TASK;
  }

  DeferredTask& operator=(DeferredTask&& other) noexcept {
    if (this != &other) {
      cancel();
      scheduler = std::move(other.scheduler);
      id = other.id;
      other.id = Scheduler::INVALID_TASK;
    }
    return *this;
  }

  ~DeferredTask() { cancel(); }

  void cancel() {
    if (scheduler && id != Scheduler::INVALID_TASK) {
      scheduler->cancel(id);
    }
    id = Scheduler::INVALID_TASK;
  }

  bool isPending() const {
    return scheduler && id != Scheduler::INVALID_TASK &&
           scheduler->isPending(id);
  }

  Scheduler::TaskId getId() const { return id; }

 protected:
  shared_ptr<Scheduler> scheduler;
  Scheduler::TaskId id;
};
}  // namespace dx

#endif  // __DX_SCHEDULER__
