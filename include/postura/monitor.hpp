#pragma once
/**
 * @file monitor.hpp
 * @brief Wires the connection controller, session engine and sync layer together.
 *
 * @details
 * SUBSCRIPTIONS
 * -------------
 *   controller.state()    Connected          -> engine.on_connection_state
 *                         Connected -> Disconnected
 *                           manual           -> engine auto-ends the session
 *                           otherwise        -> loss pause, notice, auto-reconnect
 *   controller.latest()   Reading            -> engine.on_reading, sync.persist
 *   controller.replies()  ControlReply       -> engine.on_reply
 *
 * Readings are restamped with the wall clock before they are persisted; the
 * controller stamps them with the monotonic clock for staleness.
 *
 * PERIODIC TASKS (scheduler thread)
 * ---------------------------------
 *   session tick   every tick_ms    engine.tick()
 *   watchdog       every tick_ms    Connected, session active, not manually
 *                                   disconnected, and nothing received for
 *                                   stale_ms -> loss pause, notice,
 *                                   drop("no data"), auto-reconnect
 *
 * The last-reading time is cleared on every disconnect. Until the first
 * reading of a new connection the watchdog measures from the connect time.
 *
 * Loss notices share one rate limiter (notice_interval_ms).
 *
 * LIFETIME
 * --------
 * Controller callbacks may hold the controller's lifecycle lock, so anything
 * that calls back into the controller is posted to the scheduler. Stop the
 * scheduler (or drain it) before destroying the Monitor.
 */

#include <cstdint>
#include <mutex>

#include "postura/connection.hpp"
#include "postura/observable.hpp"
#include "postura/scheduler.hpp"
#include "postura/session.hpp"
#include "postura/status.hpp"
#include "postura/sync.hpp"

namespace postura {

struct MonitorOptions {
  uint64_t stale_ms{6000};
  uint64_t tick_ms{1000};
  uint64_t notice_interval_ms{10000};
};

class Monitor {
public:
  Monitor(ConnectionController& ctl, SessionEngine& engine, SyncOrchestrator& sync,
          IScheduler& sched, INotifier& notifier, MonitorOptions opt = {});
  ~Monitor();

  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  /// Subscribe and start the periodic tasks. Idempotent.
  void start();
  /// Unsubscribe and stop the periodic tasks. Idempotent.
  void stop();

  /// Flip the session pause and mirror it to the device.
  Status toggle_pause();
  /// Enable or disable the posture alarm here and on the device.
  Status set_alarm(bool on);

  /// One watchdog evaluation; also runs every tick_ms once started.
  void watchdog_tick();

private:
  void on_state(ConnectionState s);
  void on_reading(const std::optional<Reading>& r);
  void loss_notice(const char* text);

  ConnectionController& ctl_;
  SessionEngine&        engine_;
  SyncOrchestrator&     sync_;
  IScheduler&           sched_;
  INotifier&            notifier_;
  MonitorOptions        opt_;

  PeriodicTask session_tick_;
  PeriodicTask watchdog_;

  std::mutex      mtx_;
  bool            started_{false};
  ConnectionState last_state_{ConnectionState::Disconnected};
  bool            noticed_{false};
  uint64_t        last_notice_ms_{0};

  Subscription state_sub_;
  Subscription reading_sub_;
  Subscription reply_sub_;
};

} // namespace postura
