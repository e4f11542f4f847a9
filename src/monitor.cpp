// ============================================================================
// monitor.cpp: implementation for monitor.hpp
// ============================================================================

#include "postura/monitor.hpp"
#include "postura/log.hpp"

#include <utility>

namespace postura {

Monitor::Monitor(ConnectionController& ctl, SessionEngine& engine, SyncOrchestrator& sync,
                 IScheduler& sched, INotifier& notifier, MonitorOptions opt)
: ctl_(ctl), engine_(engine), sync_(sync), sched_(sched), notifier_(notifier), opt_(opt),
  session_tick_(sched, opt.tick_ms, [this] { engine_.tick(); }),
  watchdog_(sched, opt.tick_ms, [this] { watchdog_tick(); }) {}

Monitor::~Monitor() { stop(); }

void Monitor::start() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (started_) return;
    started_ = true;
    last_state_ = ctl_.state().get();
  }
  state_sub_   = ctl_.state().subscribe([this](const ConnectionState& s) { on_state(s); });
  reading_sub_ = ctl_.latest().subscribe([this](const std::optional<Reading>& r) { on_reading(r); });
  reply_sub_   = ctl_.replies().subscribe([this](const ControlReply& r) { engine_.on_reply(r); });
  session_tick_.start();
  watchdog_.start();
  log::debug("monitor_started", {{"stale_ms", std::to_string(opt_.stale_ms)}});
}

void Monitor::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!started_) return;
    started_ = false;
  }
  watchdog_.stop();
  session_tick_.stop();
  reply_sub_.reset();
  reading_sub_.reset();
  state_sub_.reset();
}

// ---------------------------------------------------------------------------
// on_state()
// ----------
// Runs on whichever thread changed the state, possibly under the
// controller's lifecycle lock: no synchronous calls back into it.
// ---------------------------------------------------------------------------
void Monitor::on_state(ConnectionState s) {
  ConnectionState prev;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    prev = last_state_;
    last_state_ = s;
  }

  if (s == ConnectionState::Connected) {
    engine_.on_connection_state(s, false);
    return;
  }
  if (s != ConnectionState::Disconnected || prev != ConnectionState::Connected) return;

  const bool manual = ctl_.manually_disconnected();
  engine_.on_connection_state(s, manual);
  if (manual) return;

  loss_notice("Connection lost. Reconnecting...");
  sched_.schedule(0, [this] { ctl_.start_auto_reconnect(); });
}

void Monitor::on_reading(const std::optional<Reading>& r) {
  if (!r) return;
  engine_.on_reading(*r);
  // Buffered on failure; the orchestrator reports it.
  const Status st = sync_.persist(r->with_timestamp(sched_.wall_ms()));
  if (!ok(st)) log::debug("reading_not_stored", {{"reason", to_string(st)}});
}

void Monitor::loss_notice(const char* text) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    const uint64_t now = sched_.now_ms();
    if (noticed_ && now - last_notice_ms_ < opt_.notice_interval_ms) return;
    noticed_ = true;
    last_notice_ms_ = now;
  }
  log::info("notice", {{"text", text}});
  notifier_.notice(text);
}

void Monitor::watchdog_tick() {
  if (ctl_.state().get() != ConnectionState::Connected) return;
  if (ctl_.manually_disconnected()) return;
  if (engine_.state() == SessionState::Inactive) return;

  const uint64_t now  = sched_.now_ms();
  const uint64_t last = ctl_.last_reading_at().get().value_or(ctl_.connected_since());
  if (now < last || now - last < opt_.stale_ms) return;

  log::warn("sensor_stale", {{"silent_ms", std::to_string(now - last)}});
  engine_.on_connection_lost();
  loss_notice("No data from sensor. Reconnecting...");
  ctl_.drop("no data");
  ctl_.start_auto_reconnect();
}

// ---------------------------------------------------------------------------
// user actions
// ---------------------------------------------------------------------------

Status Monitor::toggle_pause() {
  const std::optional<bool> paused = engine_.toggle_pause();
  if (!paused) {
    notifier_.notice("No active session");
    return Status::NotFound;
  }
  const char* cmd = *paused ? "PAUSE ON" : "PAUSE OFF";
  const Status st = ctl_.set_pause(*paused ? PauseCommand::On : PauseCommand::Off);
  if (st == Status::NotConnected) {
    log::debug("pause_not_sent", {{"cmd", cmd}});
  } else if (!ok(st)) {
    notifier_.notice(std::string("Could not send ") + cmd);
  }
  return st;
}

Status Monitor::set_alarm(bool on) {
  engine_.set_alarm_enabled(on);
  const char* cmd = on ? "ALARM ON" : "ALARM OFF";
  const Status st = ctl_.set_alarm(on);
  if (st == Status::NotConnected) {
    log::debug("alarm_not_sent", {{"cmd", cmd}});
  } else if (!ok(st)) {
    notifier_.notice(std::string("Could not send ") + cmd);
  }
  return st;
}

} // namespace postura
