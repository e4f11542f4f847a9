// ============================================================================
// connection.cpp: implementation for connection.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "postura/connection.hpp"
#include "postura/log.hpp"

#include <chrono>
#include <utility>

namespace postura {

namespace {

constexpr const char* REASON_LOST = "connection lost";

// Reader retry interval while another thread holds the lifecycle lock.
constexpr auto LOCK_RETRY = std::chrono::milliseconds(10);

} // namespace

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
  }
  return "disconnected";
}

uint64_t BackoffPolicy::delay_after(unsigned failures) const {
  if (failures == 0) return 0;
  uint64_t d = start_ms_;
  for (unsigned i = 1; i < failures; ++i) {
    if (d >= cap_ms_) break;
    d *= 2;
  }
  return d < cap_ms_ ? d : cap_ms_;
}

ConnectionController::ConnectionController(transport::ILink& link, IPeerDirectory& peers,
                                           IScheduler& sched, ControllerOptions opt)
: link_(link), peers_(peers), sched_(sched),
  patterns_(std::move(opt.peer_patterns)), backoff_(opt.backoff), envelope_(opt.envelope) {}

ConnectionController::~ConnectionController() {
  cancel_auto_reconnect();
  std::lock_guard<std::timed_mutex> lk(lifecycle_mtx_);
  teardown_locked(false);
  // Joined but possibly still Connected on paper; no subscriber should care now.
}

// ---------------------------------------------------------------------------
// peers
// ---------------------------------------------------------------------------

std::vector<PeerDescriptor> ConnectionController::list_paired() const {
  return peers_.list_paired();
}

std::optional<PeerDescriptor> ConnectionController::find_default_peer() const {
  return postura::find_default_peer(peers_.list_paired(), patterns_);
}

std::optional<std::string> ConnectionController::last_address() const {
  std::lock_guard<std::mutex> lk(addr_mtx_);
  return last_address_;
}

void ConnectionController::set_envelope_options(const envelope::EnvelopeOptions& opt) {
  std::lock_guard<std::mutex> lk(env_mtx_);
  envelope_ = opt;
}

envelope::EnvelopeOptions ConnectionController::envelope_options() const {
  std::lock_guard<std::mutex> lk(env_mtx_);
  return envelope_;
}

// ---------------------------------------------------------------------------
// teardown_locked()
// -----------------
// Stop the reader and release the link.
// - From any other thread: retire the generation, wake the reader, join it.
// - From the reader itself: it is already leaving its loop; skip the join.
// The link is closed on every path. A reader that finished on its own is
// joined here on the next teardown.
// ---------------------------------------------------------------------------
void ConnectionController::teardown_locked(bool from_reader) {
  active_gen_.store(0);
  if (!from_reader) {
    link_.interrupt();
    if (reader_.joinable()) reader_.join();
  }
  std::lock_guard<std::mutex> io(io_mtx_);
  link_.close();
}

void ConnectionController::mark_disconnected_locked(const std::optional<std::string>& reason) {
  if (reason) last_error_.set(reason);
  latest_.set(std::nullopt);
  last_reading_at_.set(std::nullopt);
  state_.set(ConnectionState::Disconnected);
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// Close whatever was there, open the new address, start the reader, probe
// with PING. Never throws; the reason for a failure lands in last_error().
// ---------------------------------------------------------------------------
Status ConnectionController::connect(const PeerDescriptor& peer) {
  return open_peer(peer, false);
}

Status ConnectionController::open_peer(const PeerDescriptor& peer, bool from_auto) {
  {
    std::lock_guard<std::timed_mutex> lk(lifecycle_mtx_);
    // A user disconnect that landed while the attempt was scanning wins.
    if (from_auto && manual_.load()) {
      log::info("reconnect_aborted", {{"reason", "manual_disconnect"}});
      return Status::Interrupted;
    }
    teardown_locked(false);
    if (state_.get() != ConnectionState::Disconnected) {
      // Switching peers ends the old connection the way a user disconnect does.
      manual_.store(true);
      mark_disconnected_locked(std::nullopt);
    }
    manual_.store(false);

    state_.set(ConnectionState::Connecting);
    log::info("connecting", {{"peer", peer.name}, {"dev", peer.address}});

    const Status st = link_.open(peer.address);
    if (!ok(st)) {
      log::warn("connect_failed", {{"peer", peer.name}, {"reason", to_string(st)}});
      last_error_.set(std::string("connect failed: ") + to_string(st));
      state_.set(ConnectionState::Disconnected);
      return st;
    }

    {
      std::lock_guard<std::mutex> alk(addr_mtx_);
      last_address_ = peer.address;
    }
    last_error_.set(std::nullopt);
    connected_since_.store(sched_.now_ms());

    const uint64_t gen = next_gen_++;
    active_gen_.store(gen);
    state_.set(ConnectionState::Connected);
    reader_ = std::thread([this, gen] { reader_loop(gen); });
    log::info("connected", {{"peer", peer.name}});
  }

  // Liveness probe; a failure here already dropped the connection.
  const Status probe = ping();
  if (!ok(probe)) return probe;
  return Status::Ok;
}

void ConnectionController::disconnect() {
  manual_.store(true);
  cancel_auto_reconnect();
  std::lock_guard<std::timed_mutex> lk(lifecycle_mtx_);
  teardown_locked(false);
  mark_disconnected_locked(std::nullopt);
  log::info("disconnected", {{"by", "user"}});
}

void ConnectionController::drop(const std::string& reason) {
  std::lock_guard<std::timed_mutex> lk(lifecycle_mtx_);
  if (state_.get() != ConnectionState::Connected) return;
  teardown_locked(false);
  mark_disconnected_locked(reason);
  log::warn("disconnected", {{"by", "drop"}, {"reason", reason}});
}

Status ConnectionController::reconnect() {
  return reconnect_to_known(false);
}

Status ConnectionController::reconnect_to_known(bool from_auto) {
  const auto peers = peers_.list_paired();
  std::optional<PeerDescriptor> target;

  if (const auto addr = last_address()) {
    for (const auto& p : peers) {
      if (p.address == *addr) { target = p; break; }
    }
  }
  if (!target) target = postura::find_default_peer(peers, patterns_);
  if (!target) {
    last_error_.set(std::string("no paired sensor found"));
    log::warn("reconnect_failed", {{"reason", to_string(Status::PeerNotFound)}});
    return Status::PeerNotFound;
  }
  return open_peer(*target, from_auto);
}

// ---------------------------------------------------------------------------
// reader_loop()
// -------------
// Blocking line pump for one connection generation. Interrupted means a
// teardown is under way elsewhere: leave quietly. Any other failure ends
// the connection from this side.
// ---------------------------------------------------------------------------
void ConnectionController::reader_loop(uint64_t gen) {
  log::debug("reader_started", {{"gen", std::to_string(gen)}});
  std::string line;
  for (;;) {
    const Status st = link_.read_line(line);
    if (st == Status::Interrupted || active_gen_.load() != gen) break;
    if (!ok(st)) {
      on_reader_failure(gen, st);
      break;
    }
    handle_line(line);
  }
  log::debug("reader_stopped", {{"gen", std::to_string(gen)}});
}

void ConnectionController::on_reader_failure(uint64_t gen, Status st) {
  std::unique_lock<std::timed_mutex> lk(lifecycle_mtx_, std::defer_lock);
  // The holder may be a teardown waiting to join us: give way once it has
  // retired our generation.
  while (!lk.try_lock_for(LOCK_RETRY)) {
    if (active_gen_.load() != gen) return;
  }
  if (active_gen_.load() != gen) return;

  log::warn("read_failed", {{"reason", to_string(st)}});
  teardown_locked(true);
  mark_disconnected_locked(std::string(REASON_LOST));
}

void ConnectionController::handle_line(const std::string& raw) {
  const std::string line = trim(raw);
  if (line.empty()) return;

  std::string body;
  const Status est = envelope::process_incoming(line, envelope_options(), body);
  if (!ok(est)) {
    log::warn("line_rejected", {{"reason", to_string(est)}, {"line", line}});
    return;
  }
  body = trim(body);

  const LineKind kind = classify_line(body);
  switch (kind) {
    case LineKind::StatusReport: {
      const uint64_t now = sched_.now_ms();
      Reading r;
      const Status pst = parse_status_line(body, now, r);
      if (!ok(pst)) {
        log::warn("line_rejected", {{"reason", to_string(pst)}, {"line", body}});
        return;
      }
      last_reading_at_.set(now);
      latest_.set(r);
      break;
    }
    case LineKind::Pong:
    case LineKind::Ack:
    case LineKind::Nack:
      if (kind == LineKind::Nack) log::warn("reply", {{"kind", to_string(kind)}, {"text", body}});
      else                        log::debug("reply", {{"kind", to_string(kind)}, {"text", body}});
      replies_.publish(ControlReply{kind, body});
      break;
    case LineKind::Unknown:
      log::debug("line_ignored", {{"line", body}});
      break;
  }
}

// ---------------------------------------------------------------------------
// commands
// ---------------------------------------------------------------------------

Status ConnectionController::send_command(const std::string& cmd) {
  if (state_.get() != ConnectionState::Connected) return Status::NotConnected;

  const std::string wire = envelope::prepare_outgoing(cmd, envelope_options()) + "\n";
  Status st;
  {
    std::lock_guard<std::mutex> io(io_mtx_);
    st = link_.write(wire);
  }
  if (!ok(st)) {
    log::warn("command_failed", {{"cmd", cmd}, {"reason", to_string(st)}});
    drop(REASON_LOST);
    return Status::WriteFailed;
  }
  log::debug("command_sent", {{"cmd", cmd}});
  return Status::Ok;
}

Status ConnectionController::set_green(int mm) {
  if (mm < GREEN_MIN_MM || mm > GREEN_MAX_MM) return Status::OutOfRange;
  return send_command("SET GREEN " + std::to_string(mm));
}

Status ConnectionController::set_red(int mm) {
  if (mm < RED_MIN_MM || mm > RED_MAX_MM) return Status::OutOfRange;
  return send_command("SET RED " + std::to_string(mm));
}

Status ConnectionController::set_alert_time(int ms) {
  if (ms < ALERT_TIME_MIN_MS || ms > ALERT_TIME_MAX_MS) return Status::OutOfRange;
  return send_command("SET TIME " + std::to_string(ms));
}

Status ConnectionController::set_alarm(bool on) {
  return send_command(on ? "ALARM ON" : "ALARM OFF");
}

Status ConnectionController::set_pause(PauseCommand cmd) {
  switch (cmd) {
    case PauseCommand::On:     return send_command("PAUSE ON");
    case PauseCommand::Off:    return send_command("PAUSE OFF");
    case PauseCommand::Toggle: return send_command("PAUSE TOGGLE");
  }
  return Status::OutOfRange;
}

Status ConnectionController::ping() { return send_command("PING"); }

// ---------------------------------------------------------------------------
// auto-reconnect
// ---------------------------------------------------------------------------

void ConnectionController::start_auto_reconnect() {
  {
    std::lock_guard<std::mutex> lk(reconnect_mtx_);
    if (reconnect_active_ || manual_.load()) return;
    reconnect_active_ = true;
    failures_ = 0;
    reconnect_task_ = sched_.schedule(0, [this] { reconnect_step(); });
  }
  log::info("reconnect_started");
  reconnecting_.set(true);
}

void ConnectionController::cancel_auto_reconnect() {
  TaskId pending = NO_TASK;
  {
    std::lock_guard<std::mutex> lk(reconnect_mtx_);
    if (!reconnect_active_) return;
    reconnect_active_ = false;
    pending = reconnect_task_;
    reconnect_task_ = NO_TASK;
  }
  sched_.cancel(pending);
  reconnecting_.set(false);
}

void ConnectionController::reconnect_step() {
  {
    std::lock_guard<std::mutex> lk(reconnect_mtx_);
    reconnect_task_ = NO_TASK;
    if (!reconnect_active_) return;
  }

  Status st = Status::Ok;
  if (!manual_.load() && state_.get() != ConnectionState::Connected) {
    st = reconnect_to_known(true);
  }

  bool finished = false;
  {
    std::lock_guard<std::mutex> lk(reconnect_mtx_);
    if (!reconnect_active_) return;
    if (manual_.load() || ok(st)) {
      reconnect_active_ = false;
      failures_ = 0;
      finished = true;
    } else {
      ++failures_;
      const uint64_t delay = backoff_.delay_after(failures_);
      log::info("reconnect_backoff", {{"attempt", std::to_string(failures_)},
                                      {"reason", to_string(st)},
                                      {"delay_ms", std::to_string(delay)}});
      reconnect_task_ = sched_.schedule(delay, [this] { reconnect_step(); });
    }
  }
  if (finished) reconnecting_.set(false);
}

} // namespace postura
