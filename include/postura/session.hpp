#pragma once
/**
 * @file session.hpp
 * @brief Session accounting: effective seated time, pause handling, posture alerts, break reminder.
 *
 * @details
 * STATES
 * ------
 *   Inactive --first Connected / restart()--> Running <--> Paused
 *   Running|Paused --finalize() ok / manual disconnect--> Inactive (record persisted)
 *
 * TIME
 * ----
 *   effective = accumulated + (running ? now - segment_start : 0)
 *
 * `accumulated` grows only when leaving Running. Pausing twice in a row does
 * nothing the second time, so the effective duration has no discontinuity at
 * a pause and stays flat while paused. All time comes from the scheduler's
 * monotonic clock; record start/end use its wall clock.
 *
 * PAUSE SOURCES
 * -------------
 *   user toggle        pauses or resumes; a resume clears the loss flag
 *   device PAUS flag   follows the device, except it never resumes a loss pause
 *   connection loss    pauses and sets the loss flag (watchdog or dropped link)
 *
 * A loss pause ends only by user action, or by the PONG answering the
 * post-reconnect probe when `resume_on_reconnect_ack` is set. Otherwise the
 * engine reports "Reconnected. Session still paused" and waits.
 *
 * POSTURE ALERT
 * -------------
 * While running, a good->bad transition (Bad or Alert) arms a one-shot timer
 * if the alarm is enabled. If the posture is still bad when it fires, the
 * alert count goes up by one and the alarm plays, once per episode. Good
 * posture, a pause, finalize or restart cancels the timer.
 *
 * BREAK REMINDER
 * --------------
 * Checked on every `tick()` (1 s). Fires once per session when the effective
 * duration first reaches `break_after_ms`.
 *
 * THREADS
 * -------
 * Methods may be called from the reader, scheduler and CLI threads. State is
 * guarded by one mutex. Notices, the alarm, the record sink and observable
 * updates run after it is released.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "postura/connection.hpp"
#include "postura/observable.hpp"
#include "postura/reading.hpp"
#include "postura/scheduler.hpp"
#include "postura/status.hpp"
#include "postura/status_line.hpp"

namespace postura {

/// One finished monitoring interval. Persisted once, never changed after.
struct SessionRecord {
  std::string id;                 ///< assigned by the store on first save
  uint64_t    start_ms{0};        ///< wall clock
  uint64_t    end_ms{0};          ///< wall clock
  uint64_t    duration_ms{0};     ///< effective, pauses excluded
  int         alert_count{0};
  bool        break_reminder_shown{false};
  int         green_mm{GREEN_DEFAULT_MM};
  int         red_mm{RED_DEFAULT_MM};
  std::string owner;

  /// "2h 35m 42s", "35m 42s" or "42s".
  std::string format_duration() const;
};

/// "HH:MM:SS"; hours are not wrapped at 24.
std::string format_clock(uint64_t ms);

void to_json(nlohmann::json& j, const SessionRecord& r);
void from_json(const nlohmann::json& j, SessionRecord& r);

struct SessionStats {
  size_t   total_sessions{0};
  uint64_t total_duration_ms{0};
  int      total_alerts{0};
  uint64_t average_duration_ms{0};
  double   average_alerts{0.0};
};

SessionStats summarize(const std::vector<SessionRecord>& sessions);

/// Where finished sessions go. Fills in `rec.id` on success.
class IRecordSink {
public:
  virtual ~IRecordSink() = default;
  virtual Status persist_session(SessionRecord& rec) = 0;
};

/// User-facing side effects.
class INotifier {
public:
  virtual ~INotifier() = default;
  virtual void notice(const std::string& text) = 0;
  virtual void play_alarm() = 0;
};

enum class SessionState : uint8_t { Inactive, Running, Paused };

const char* to_string(SessionState s);

struct SessionOptions {
  uint64_t    alert_delay_ms{5000};
  uint64_t    break_after_ms{3600000};
  uint64_t    restart_min_ms{5000};   ///< restart() saves only longer sessions
  bool        resume_on_reconnect_ack{false};
  bool        alarm_enabled{true};
  std::string owner;
};

struct SessionSnapshot {
  SessionState state{SessionState::Inactive};
  uint64_t     effective_ms{0};
  std::string  clock{"00:00:00"};
  bool         loss_paused{false};
  bool         bad_posture{false};
  int          alert_count{0};
  bool         break_reminder_shown{false};
  bool         alarm_enabled{true};
};

class SessionEngine {
public:
  SessionEngine(IScheduler& sched, IRecordSink& sink, INotifier& notifier, SessionOptions opt = {});
  ~SessionEngine();

  SessionEngine(const SessionEngine&) = delete;
  SessionEngine& operator=(const SessionEngine&) = delete;

  // --- inputs --------------------------------------------------------------
  /// @param manual  true when the Disconnected came from a user disconnect.
  void on_connection_state(ConnectionState s, bool manual);
  void on_reading(const Reading& r);
  void on_reply(const ControlReply& reply);
  /// Pause because data stopped arriving (watchdog) or the link dropped.
  void on_connection_lost();
  /// 1 s session clock: refreshes elapsed() and checks the break reminder.
  void tick();

  // --- user actions --------------------------------------------------------
  /// Flip pause. Returns the new paused flag, or nullopt when inactive.
  std::optional<bool> toggle_pause();
  Status finalize();
  Status restart();
  void   reset_timer();
  void   set_alarm_enabled(bool on);

  // --- queries -------------------------------------------------------------
  SessionState    state() const;
  bool            alarm_enabled() const;
  int             alert_count() const;
  uint64_t        effective_duration() const;
  SessionSnapshot snapshot() const;

  Observable<SessionState>& state_changes() { return state_obs_; }
  Observable<uint64_t>&     elapsed()       { return elapsed_obs_; }

private:
  // Side effects collected under the lock and run after it is released.
  struct Effects {
    std::vector<std::string>    notices;
    bool                        alarm{false};
    std::optional<SessionState> state;
    std::optional<uint64_t>     elapsed;
    std::vector<TaskId>         cancel;
  };

  void flush(Effects& fx);

  // Caller holds mtx_.
  void start_locked(uint64_t now, Effects& fx);
  void set_paused_locked(bool paused, uint64_t now, Effects& fx);
  void clear_alert_locked(Effects& fx);
  void end_locked(Effects& fx);
  uint64_t effective_locked(uint64_t now) const;
  SessionRecord build_record_locked(uint64_t now) const;

  void on_alert_timer(uint64_t episode);

  IScheduler&    sched_;
  IRecordSink&   sink_;
  INotifier&     notifier_;
  SessionOptions opt_;

  mutable std::mutex mtx_;
  SessionState state_{SessionState::Inactive};
  uint64_t start_wall_ms_{0};
  uint64_t accumulated_ms_{0};
  uint64_t segment_start_ms_{0};
  uint64_t generation_{0};        // bumps on every start; guards async finalize
  int      alert_count_{0};
  bool     break_shown_{false};
  bool     loss_paused_{false};
  bool     awaiting_ack_{false};
  bool     bad_posture_{false};
  bool     alarm_enabled_{true};
  uint64_t episode_{0};
  TaskId   alert_task_{NO_TASK};
  int      green_mm_{GREEN_DEFAULT_MM};
  int      red_mm_{RED_DEFAULT_MM};

  Observable<SessionState> state_obs_{SessionState::Inactive};
  Observable<uint64_t>     elapsed_obs_{0};
};

} // namespace postura
