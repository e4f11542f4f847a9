// ============================================================================
// session.cpp: implementation for session.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "postura/session.hpp"
#include "postura/log.hpp"

#include <cstdio>
#include <utility>

namespace postura {

// ---------------------------------------------------------------------------
// SessionRecord helpers
// ---------------------------------------------------------------------------

std::string SessionRecord::format_duration() const {
  const uint64_t seconds = (duration_ms / 1000) % 60;
  const uint64_t minutes = (duration_ms / 60000) % 60;
  const uint64_t hours   = duration_ms / 3600000;

  if (hours > 0)
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
  if (minutes > 0)
    return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
  return std::to_string(seconds) + "s";
}

std::string format_clock(uint64_t ms) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu",
                static_cast<unsigned long long>(ms / 3600000),
                static_cast<unsigned long long>((ms / 60000) % 60),
                static_cast<unsigned long long>((ms / 1000) % 60));
  return buf;
}

void to_json(nlohmann::json& j, const SessionRecord& r) {
  j = nlohmann::json{
    {"sessionId",        r.id},
    {"startTimestamp",   r.start_ms},
    {"endTimestamp",     r.end_ms},
    {"durationMs",       r.duration_ms},
    {"badPostureAlerts", r.alert_count},
    {"breakAlertShown",  r.break_reminder_shown},
    {"umbralVerde",      r.green_mm},
    {"umbralRojo",       r.red_mm},
    {"userId",           r.owner},
  };
}

void from_json(const nlohmann::json& j, SessionRecord& r) {
  r.id                   = j.value("sessionId", std::string());
  r.start_ms             = j.value("startTimestamp", uint64_t{0});
  r.end_ms               = j.value("endTimestamp", uint64_t{0});
  r.duration_ms          = j.value("durationMs", uint64_t{0});
  r.alert_count          = j.value("badPostureAlerts", 0);
  r.break_reminder_shown = j.value("breakAlertShown", false);
  r.green_mm             = j.value("umbralVerde", GREEN_DEFAULT_MM);
  r.red_mm               = j.value("umbralRojo", RED_DEFAULT_MM);
  r.owner                = j.value("userId", std::string());
}

SessionStats summarize(const std::vector<SessionRecord>& sessions) {
  SessionStats s;
  s.total_sessions = sessions.size();
  for (const auto& r : sessions) {
    s.total_duration_ms += r.duration_ms;
    s.total_alerts      += r.alert_count;
  }
  if (!sessions.empty()) {
    s.average_duration_ms = s.total_duration_ms / sessions.size();
    s.average_alerts      = static_cast<double>(s.total_alerts) / static_cast<double>(sessions.size());
  }
  return s;
}

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Inactive: return "inactive";
    case SessionState::Running:  return "running";
    case SessionState::Paused:   return "paused";
  }
  return "inactive";
}

// ---------------------------------------------------------------------------
// SessionEngine
// ---------------------------------------------------------------------------

SessionEngine::SessionEngine(IScheduler& sched, IRecordSink& sink, INotifier& notifier,
                             SessionOptions opt)
: sched_(sched), sink_(sink), notifier_(notifier), opt_(std::move(opt)),
  alarm_enabled_(opt_.alarm_enabled) {}

SessionEngine::~SessionEngine() {
  TaskId pending = NO_TASK;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    pending = alert_task_;
    alert_task_ = NO_TASK;
    ++episode_;
  }
  sched_.cancel(pending);
}

void SessionEngine::flush(Effects& fx) {
  for (TaskId id : fx.cancel) sched_.cancel(id);
  if (fx.state)   state_obs_.set(*fx.state);
  if (fx.elapsed) elapsed_obs_.set(*fx.elapsed);
  if (fx.alarm)   notifier_.play_alarm();
  for (const auto& n : fx.notices) {
    log::info("notice", {{"text", n}});
    notifier_.notice(n);
  }
}

uint64_t SessionEngine::effective_locked(uint64_t now) const {
  if (state_ == SessionState::Inactive) return 0;
  const uint64_t running = (state_ == SessionState::Running && now > segment_start_ms_)
                               ? now - segment_start_ms_ : 0;
  return accumulated_ms_ + running;
}

void SessionEngine::clear_alert_locked(Effects& fx) {
  bad_posture_ = false;
  ++episode_;
  if (alert_task_ != NO_TASK) {
    fx.cancel.push_back(alert_task_);
    alert_task_ = NO_TASK;
  }
}

void SessionEngine::start_locked(uint64_t now, Effects& fx) {
  clear_alert_locked(fx);
  state_            = SessionState::Running;
  start_wall_ms_    = sched_.wall_ms();
  accumulated_ms_   = 0;
  segment_start_ms_ = now;
  alert_count_      = 0;
  break_shown_      = false;
  loss_paused_      = false;
  awaiting_ack_     = false;
  ++generation_;
  fx.state   = state_;
  fx.elapsed = 0;
  log::info("session_started", {{"generation", std::to_string(generation_)}});
}

void SessionEngine::end_locked(Effects& fx) {
  clear_alert_locked(fx);
  state_          = SessionState::Inactive;
  accumulated_ms_ = 0;
  alert_count_    = 0;
  break_shown_    = false;
  loss_paused_    = false;
  awaiting_ack_   = false;
  fx.state   = state_;
  fx.elapsed = 0;
}

// Fold the running segment on the way into Paused; restart the segment on the
// way out. Requests that match the current state change nothing.
void SessionEngine::set_paused_locked(bool paused, uint64_t now, Effects& fx) {
  if (state_ == SessionState::Inactive) return;
  if (paused) {
    if (state_ == SessionState::Running) {
      accumulated_ms_ += (now > segment_start_ms_) ? now - segment_start_ms_ : 0;
      state_ = SessionState::Paused;
      fx.state = state_;
    }
    clear_alert_locked(fx);
  } else if (state_ == SessionState::Paused) {
    segment_start_ms_ = now;
    state_ = SessionState::Running;
    fx.state = state_;
  }
  fx.elapsed = effective_locked(now);
}

SessionRecord SessionEngine::build_record_locked(uint64_t now) const {
  SessionRecord rec;
  rec.start_ms             = start_wall_ms_;
  rec.end_ms               = sched_.wall_ms();
  rec.duration_ms          = effective_locked(now);
  rec.alert_count          = alert_count_;
  rec.break_reminder_shown = break_shown_;
  rec.green_mm             = green_mm_;
  rec.red_mm               = red_mm_;
  rec.owner                = opt_.owner;
  return rec;
}

// ---------------------------------------------------------------------------
// inputs
// ---------------------------------------------------------------------------

void SessionEngine::on_connection_state(ConnectionState s, bool manual) {
  if (s == ConnectionState::Disconnected) {
    if (!manual) {
      on_connection_lost();
      return;
    }
    bool active = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      loss_paused_  = false;
      awaiting_ack_ = false;
      active = state_ != SessionState::Inactive;
    }
    if (active) {
      log::info("session_auto_end", {{"reason", "manual_disconnect"}});
      // A failed save leaves the session active; finalize() already told the user.
      const Status st = finalize();
      if (!ok(st)) log::warn("session_auto_end_failed", {{"reason", to_string(st)}});
    }
    return;
  }

  if (s != ConnectionState::Connected) return;

  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ == SessionState::Inactive) {
      start_locked(sched_.now_ms(), fx);
    } else if (loss_paused_) {
      awaiting_ack_ = true;
      if (!opt_.resume_on_reconnect_ack) fx.notices.emplace_back("Reconnected. Session still paused");
    }
  }
  flush(fx);
}

void SessionEngine::on_connection_lost() {
  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    awaiting_ack_ = false;
    if (state_ != SessionState::Running) return;
    loss_paused_ = true;
    set_paused_locked(true, sched_.now_ms(), fx);
    log::info("session_paused", {{"by", "connection_loss"}});
  }
  flush(fx);
}

void SessionEngine::on_reply(const ControlReply& reply) {
  if (reply.kind != LineKind::Pong) return;
  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!awaiting_ack_) return;
    awaiting_ack_ = false;
    if (opt_.resume_on_reconnect_ack && loss_paused_ && state_ == SessionState::Paused) {
      loss_paused_ = false;
      set_paused_locked(false, sched_.now_ms(), fx);
      fx.notices.emplace_back("Reconnected. Session resumed");
    }
  }
  flush(fx);
}

void SessionEngine::on_reading(const Reading& r) {
  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    green_mm_ = r.green_mm();
    red_mm_   = r.red_mm();
    if (state_ == SessionState::Inactive) return;

    const uint64_t now = sched_.now_ms();

    // Device pause follows the PAUS flag, but never lifts a loss pause.
    const bool paused_now = (state_ == SessionState::Paused);
    if (r.paused() != paused_now && !(loss_paused_ && !r.paused())) {
      set_paused_locked(r.paused(), now, fx);
      log::info(r.paused() ? "session_paused" : "session_resumed", {{"by", "device"}});
    }

    if (state_ == SessionState::Paused || r.paused()) {
      if (bad_posture_ || alert_task_ != NO_TASK) clear_alert_locked(fx);
    } else {
      const bool bad = is_bad(r.posture());
      if (bad && !bad_posture_) {
        bad_posture_ = true;
        const uint64_t episode = ++episode_;
        if (alarm_enabled_) {
          log::debug("bad_posture_started", {{"delay_ms", std::to_string(opt_.alert_delay_ms)}});
          alert_task_ = sched_.schedule(opt_.alert_delay_ms, [this, episode] { on_alert_timer(episode); });
        } else {
          log::debug("bad_posture_started", {{"alarm", "off"}});
        }
      } else if (!bad && bad_posture_) {
        clear_alert_locked(fx);
        log::debug("bad_posture_corrected");
      }
    }
  }
  flush(fx);
}

void SessionEngine::on_alert_timer(uint64_t episode) {
  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (episode != episode_) return;
    alert_task_ = NO_TASK;
    if (!bad_posture_ || state_ != SessionState::Running || !alarm_enabled_) return;
    ++alert_count_;
    fx.alarm = true;
    fx.notices.emplace_back("Correct your posture!");
    log::info("posture_alert", {{"count", std::to_string(alert_count_)}});
  }
  flush(fx);
}

void SessionEngine::tick() {
  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ == SessionState::Inactive) return;
    const uint64_t eff = effective_locked(sched_.now_ms());
    fx.elapsed = eff;
    if (!break_shown_ && eff >= opt_.break_after_ms) {
      break_shown_ = true;
      fx.alarm = alarm_enabled_;
      SessionRecord span;
      span.duration_ms = opt_.break_after_ms;
      fx.notices.push_back("Time for a break! Session has reached " + span.format_duration());
      log::info("break_reminder");
    }
  }
  flush(fx);
}

// ---------------------------------------------------------------------------
// user actions
// ---------------------------------------------------------------------------

std::optional<bool> SessionEngine::toggle_pause() {
  Effects fx;
  bool target = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ == SessionState::Inactive) return std::nullopt;
    target = (state_ != SessionState::Paused);
    if (!target) {
      loss_paused_  = false;
      awaiting_ack_ = false;
    }
    set_paused_locked(target, sched_.now_ms(), fx);
    log::info(target ? "session_paused" : "session_resumed", {{"by", "user"}});
  }
  flush(fx);
  return target;
}

// ---------------------------------------------------------------------------
// finalize()
// ----------
// Build the record, hand it to the sink with the lock released, then end the
// session only if it is still the same one and the sink accepted it.
// ---------------------------------------------------------------------------
Status SessionEngine::finalize() {
  SessionRecord rec;
  uint64_t gen = 0;
  bool inactive = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    inactive = (state_ == SessionState::Inactive);
    if (!inactive) {
      rec = build_record_locked(sched_.now_ms());
      gen = generation_;
    }
  }
  if (inactive) {
    notifier_.notice("No active session");
    return Status::NotFound;
  }

  const Status st = sink_.persist_session(rec);

  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!ok(st)) {
      log::warn("session_save_failed", {{"reason", to_string(st)}});
      fx.notices.emplace_back("Error saving session");
    } else {
      log::info("session_saved", {{"id", rec.id}, {"duration", rec.format_duration()},
                                  {"alerts", std::to_string(rec.alert_count)}});
      fx.notices.push_back("Session finished: " + rec.format_duration() + " | " +
                           std::to_string(rec.alert_count) + " alerts");
      if (gen == generation_) end_locked(fx);
    }
  }
  flush(fx);
  return st;
}

Status SessionEngine::restart() {
  SessionRecord rec;
  bool inactive = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    inactive = (state_ == SessionState::Inactive);
    if (!inactive) {
      rec = build_record_locked(sched_.now_ms());
    }
  }
  if (inactive) {
    notifier_.notice("No active session");
    return Status::NotFound;
  }

  Status st = Status::Ok;
  const bool save = rec.duration_ms > opt_.restart_min_ms;
  if (save) {
    st = sink_.persist_session(rec);
    if (!ok(st)) log::warn("session_save_failed", {{"reason", to_string(st)}});
  }

  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    start_locked(sched_.now_ms(), fx);
    if (!ok(st))   fx.notices.emplace_back("Error saving session");
    else if (save) fx.notices.emplace_back("Session saved and restarted");
    else           fx.notices.emplace_back("Session restarted");
  }
  flush(fx);
  return st;
}

void SessionEngine::reset_timer() {
  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ != SessionState::Inactive) {
      const uint64_t now = sched_.now_ms();
      clear_alert_locked(fx);
      start_wall_ms_    = sched_.wall_ms();
      accumulated_ms_   = 0;
      segment_start_ms_ = now;
      break_shown_      = false;
      loss_paused_      = false;
      awaiting_ack_     = false;
      if (state_ != SessionState::Running) {
        state_ = SessionState::Running;
        fx.state = state_;
      }
      fx.elapsed = 0;
    }
    fx.notices.emplace_back("Session timer reset");
  }
  flush(fx);
}

void SessionEngine::set_alarm_enabled(bool on) {
  Effects fx;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    alarm_enabled_ = on;
    if (!on && alert_task_ != NO_TASK) {
      fx.cancel.push_back(alert_task_);
      alert_task_ = NO_TASK;
    }
  }
  flush(fx);
}

// ---------------------------------------------------------------------------
// queries
// ---------------------------------------------------------------------------

SessionState SessionEngine::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

bool SessionEngine::alarm_enabled() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return alarm_enabled_;
}

int SessionEngine::alert_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return alert_count_;
}

uint64_t SessionEngine::effective_duration() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return effective_locked(sched_.now_ms());
}

SessionSnapshot SessionEngine::snapshot() const {
  std::lock_guard<std::mutex> lk(mtx_);
  SessionSnapshot s;
  s.state                = state_;
  s.effective_ms         = effective_locked(sched_.now_ms());
  s.clock                = format_clock(s.effective_ms);
  s.loss_paused          = loss_paused_;
  s.bad_posture          = bad_posture_;
  s.alert_count          = alert_count_;
  s.break_reminder_shown = break_shown_;
  s.alarm_enabled        = alarm_enabled_;
  return s;
}

} // namespace postura
