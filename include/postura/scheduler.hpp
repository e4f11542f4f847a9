#pragma once
/**
 * @file scheduler.hpp
 * @brief Clock and timer context shared by the controller, session engine and monitor.
 *
 * @details
 * Everything time-based goes through `IScheduler` so tests can drive a
 * virtual clock instead of sleeping:
 *
 *   - `now_ms()`   monotonic milliseconds (durations, staleness)
 *   - `wall_ms()`  Unix epoch milliseconds (record start/end times)
 *   - `schedule()` one-shot task after a delay; returns a TaskId
 *   - `cancel()`   drop a pending task; no effect once it has started
 *
 * `ThreadScheduler` runs all tasks on one dedicated thread in due order.
 * `PeriodicTask` builds fixed-rate ticks (session tick, watchdog) on top of
 * any scheduler.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace postura {

using TaskId = uint64_t;
static constexpr TaskId NO_TASK = 0;

class IScheduler {
public:
  virtual ~IScheduler() = default;
  virtual uint64_t now_ms() const = 0;
  virtual uint64_t wall_ms() const = 0;
  virtual TaskId schedule(uint64_t delay_ms, std::function<void()> fn) = 0;
  virtual void cancel(TaskId id) = 0;
};

/**
 * @brief Single timer thread executing one-shot tasks in due order.
 *
 * Tasks with the same due time run in submission order. The destructor
 * stops the thread and discards pending tasks; call `stop()` earlier if
 * tasks reference objects that die first.
 */
class ThreadScheduler : public IScheduler {
public:
  ThreadScheduler();
  ~ThreadScheduler() override;

  ThreadScheduler(const ThreadScheduler&) = delete;
  ThreadScheduler& operator=(const ThreadScheduler&) = delete;

  uint64_t now_ms() const override;
  uint64_t wall_ms() const override;
  TaskId schedule(uint64_t delay_ms, std::function<void()> fn) override;
  void cancel(TaskId id) override;

  /// Stop the thread and drop pending tasks. Idempotent.
  void stop();

private:
  void run();

  struct Key {
    uint64_t due;
    TaskId   id;
    bool operator<(const Key& o) const { return due != o.due ? due < o.due : id < o.id; }
  };

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::map<Key, std::function<void()>> queue_;
  std::map<TaskId, uint64_t> due_by_id_;
  TaskId next_id_{1};
  bool stopping_{false};
  std::thread worker_;
};

/**
 * @brief Re-arming wrapper that calls `fn` every `period_ms` until stopped.
 *
 * The first call happens one period after `start()`. State is shared with
 * the pending task, so destroying a PeriodicTask while its callback is
 * queued is safe.
 */
class PeriodicTask {
public:
  PeriodicTask(IScheduler& sched, uint64_t period_ms, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start();
  void stop();
  bool running() const;

private:
  struct State {
    IScheduler&           sched;
    uint64_t              period_ms;
    std::function<void()> fn;
    std::mutex            mtx;
    bool                  active{false};
    TaskId                pending{NO_TASK};

    State(IScheduler& s, uint64_t p, std::function<void()> f)
    : sched(s), period_ms(p), fn(std::move(f)) {}
  };

  static void arm(const std::shared_ptr<State>& st);

  std::shared_ptr<State> state_;
};

} // namespace postura
