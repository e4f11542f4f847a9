#pragma once
/**
 * @file observable.hpp
 * @brief Observable values and event streams with RAII subscriptions.
 *
 * @details
 * Components publish their state through these two primitives instead of
 * calling each other directly:
 *
 * - `Observable<T>` holds a current value. `set()` stores it and, if it
 *   differs from the previous value, notifies subscribers. New subscribers
 *   receive the current value immediately.
 * - `EventStream<T>` carries discrete events (control replies, notices).
 *   Nothing is retained; late subscribers miss earlier events.
 *
 * Callbacks run synchronously on the writer's thread, in write order, after
 * the internal lock is released. A callback may subscribe, unsubscribe, or
 * write other observables. Each observable has a single writer.
 *
 * `Subscription` unsubscribes when destroyed. It holds only a weak reference
 * to the source, so it may outlive the observable.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace postura {

class Subscription {
public:
  Subscription() = default;
  explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
  ~Subscription() { reset(); }

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& o) noexcept : cancel_(std::move(o.cancel_)) { o.cancel_ = nullptr; }
  Subscription& operator=(Subscription&& o) noexcept {
    if (this != &o) {
      reset();
      cancel_ = std::move(o.cancel_);
      o.cancel_ = nullptr;
    }
    return *this;
  }

  void reset() {
    if (cancel_) {
      auto fn = std::move(cancel_);
      cancel_ = nullptr;
      fn();
    }
  }

  bool active() const { return static_cast<bool>(cancel_); }

private:
  std::function<void()> cancel_;
};

namespace detail {

// Shared between a source and the Subscriptions it hands out.
template <typename T>
struct Subscribers {
  using Callback = std::function<void(const T&)>;

  std::mutex mtx;
  std::map<uint64_t, std::shared_ptr<Callback>> entries;
  uint64_t next_id{1};

  uint64_t add(Callback cb) {
    std::lock_guard<std::mutex> lk(mtx);
    const uint64_t id = next_id++;
    entries.emplace(id, std::make_shared<Callback>(std::move(cb)));
    return id;
  }

  void remove(uint64_t id) {
    std::lock_guard<std::mutex> lk(mtx);
    entries.erase(id);
  }

  // Caller must hold mtx.
  std::vector<std::shared_ptr<Callback>> snapshot_locked() const {
    std::vector<std::shared_ptr<Callback>> out;
    out.reserve(entries.size());
    for (const auto& kv : entries) out.push_back(kv.second);
    return out;
  }
};

template <typename T>
Subscription make_subscription(const std::shared_ptr<Subscribers<T>>& subs, uint64_t id) {
  std::weak_ptr<Subscribers<T>> weak = subs;
  return Subscription([weak, id] {
    if (auto s = weak.lock()) s->remove(id);
  });
}

} // namespace detail

template <typename T>
class EventStream {
public:
  using Callback = std::function<void(const T&)>;

  EventStream() : subs_(std::make_shared<detail::Subscribers<T>>()) {}

  EventStream(const EventStream&) = delete;
  EventStream& operator=(const EventStream&) = delete;

  Subscription subscribe(Callback cb) {
    return detail::make_subscription(subs_, subs_->add(std::move(cb)));
  }

  void publish(const T& event) {
    std::vector<std::shared_ptr<Callback>> targets;
    {
      std::lock_guard<std::mutex> lk(subs_->mtx);
      targets = subs_->snapshot_locked();
    }
    for (const auto& cb : targets) (*cb)(event);
  }

private:
  std::shared_ptr<detail::Subscribers<T>> subs_;
};

template <typename T>
class Observable {
public:
  using Callback = std::function<void(const T&)>;

  explicit Observable(T initial = T{})
  : value_(std::move(initial)), subs_(std::make_shared<detail::Subscribers<T>>()) {}

  Observable(const Observable&) = delete;
  Observable& operator=(const Observable&) = delete;

  T get() const {
    std::lock_guard<std::mutex> lk(subs_->mtx);
    return value_;
  }

  /// Store and notify. Returns false (and notifies nobody) if unchanged.
  bool set(T v) {
    std::vector<std::shared_ptr<Callback>> targets;
    {
      std::lock_guard<std::mutex> lk(subs_->mtx);
      if (value_ == v) return false;
      value_ = std::move(v);
      targets = subs_->snapshot_locked();
      v = value_;
    }
    for (const auto& cb : targets) (*cb)(v);
    return true;
  }

  /// Subscribe; `cb` is invoked once right away with the current value.
  Subscription subscribe(Callback cb) {
    auto shared = std::make_shared<Callback>(std::move(cb));
    T current;
    uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lk(subs_->mtx);
      id = subs_->next_id++;
      subs_->entries.emplace(id, shared);
      current = value_;
    }
    (*shared)(current);
    return detail::make_subscription(subs_, id);
  }

private:
  T value_;
  std::shared_ptr<detail::Subscribers<T>> subs_;
};

} // namespace postura
