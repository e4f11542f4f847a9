// ============================================================================
// scheduler.cpp: implementation for scheduler.hpp
// ============================================================================

#include "postura/scheduler.hpp"
#include "postura/log.hpp"

#include <chrono>
#include <exception>
#include <vector>

namespace postura {

ThreadScheduler::ThreadScheduler() : worker_([this] { run(); }) {}

ThreadScheduler::~ThreadScheduler() { stop(); }

uint64_t ThreadScheduler::now_ms() const {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

uint64_t ThreadScheduler::wall_ms() const {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

TaskId ThreadScheduler::schedule(uint64_t delay_ms, std::function<void()> fn) {
  const uint64_t due = now_ms() + delay_ms;
  std::lock_guard<std::mutex> lk(mtx_);
  if (stopping_) return NO_TASK;
  const TaskId id = next_id_++;
  queue_.emplace(Key{due, id}, std::move(fn));
  due_by_id_.emplace(id, due);
  cv_.notify_one();
  return id;
}

void ThreadScheduler::cancel(TaskId id) {
  if (id == NO_TASK) return;
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = due_by_id_.find(id);
  if (it == due_by_id_.end()) return;
  queue_.erase(Key{it->second, id});
  due_by_id_.erase(it);
}

void ThreadScheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stopping_ && !worker_.joinable()) return;
    stopping_ = true;
    queue_.clear();
    due_by_id_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

// ---------------------------------------------------------------------------
// run()
// -----
// Sleep until the earliest due task (or a new earlier one arrives), pop it,
// run it with the lock released. A throwing task is logged and dropped; the
// timer thread keeps going.
// ---------------------------------------------------------------------------
void ThreadScheduler::run() {
  std::unique_lock<std::mutex> lk(mtx_);
  while (!stopping_) {
    if (queue_.empty()) {
      cv_.wait(lk);
      continue;
    }
    const uint64_t now = now_ms();
    auto head = queue_.begin();
    if (head->first.due > now) {
      cv_.wait_for(lk, std::chrono::milliseconds(head->first.due - now));
      continue;
    }
    auto fn = std::move(head->second);
    due_by_id_.erase(head->first.id);
    queue_.erase(head);

    lk.unlock();
    try {
      fn();
    } catch (const std::exception& e) {
      log::error("scheduler_task_failed", {{"what", e.what()}});
    }
    lk.lock();
  }
}

// ---------------------------------------------------------------------------
// PeriodicTask
// ---------------------------------------------------------------------------

PeriodicTask::PeriodicTask(IScheduler& sched, uint64_t period_ms, std::function<void()> fn)
: state_(std::make_shared<State>(sched, period_ms, std::move(fn))) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::arm(const std::shared_ptr<State>& st) {
  std::weak_ptr<State> weak = st;
  st->pending = st->sched.schedule(st->period_ms, [weak] {
    auto s = weak.lock();
    if (!s) return;
    {
      std::lock_guard<std::mutex> lk(s->mtx);
      if (!s->active) return;
      s->pending = NO_TASK;
    }
    // A failing tick is logged and the task keeps its period.
    try {
      s->fn();
    } catch (const std::exception& e) {
      log::error("periodic_task_failed", {{"what", e.what()}});
    }
    std::lock_guard<std::mutex> lk(s->mtx);
    if (s->active && s->pending == NO_TASK) arm(s);
  });
}

void PeriodicTask::start() {
  std::lock_guard<std::mutex> lk(state_->mtx);
  if (state_->active) return;
  state_->active = true;
  arm(state_);
}

void PeriodicTask::stop() {
  TaskId pending = NO_TASK;
  {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->active = false;
    pending = state_->pending;
    state_->pending = NO_TASK;
  }
  state_->sched.cancel(pending);
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> lk(state_->mtx);
  return state_->active;
}

} // namespace postura
