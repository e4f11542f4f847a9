/**
 * @file main.cpp
 * @brief postura CLI: scan for the sensor, send commands, run the live monitor, browse sessions.
 *
 * Modes (exactly one):
 *   --scan                 list serial peers, default marked with '*'
 *   --send "<CMD>"         connect, send one command, print the reply
 *   --monitor              run until SIGINT/SIGTERM; keys on stdin:
 *                            p pause/resume   f finish session   r restart
 *                            t reset timer    a alarm on/off     q quit
 *   --sessions N           last N sessions of the owner
 *   --stats                totals over stored sessions
 *   --delete-session ID
 *   --save-config          write the effective config and exit
 *
 * Errors go to stderr as `status=error reason=<...>`.
 * Exit codes: 0 ok, 1 I/O, 2 usage/config, 3 timeout, 4 peer not found.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <ctime>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>         // isatty, read

#include <CLI/CLI11.hpp>
#include <nlohmann/json.hpp>

#include "postura/config.hpp"
#include "postura/connection.hpp"
#include "postura/log.hpp"
#include "postura/monitor.hpp"
#include "postura/offline_buffer.hpp"
#include "postura/peer_registry.hpp"
#include "postura/scheduler.hpp"
#include "postura/session.hpp"
#include "postura/store.hpp"
#include "postura/sync.hpp"
#include "postura/transport/link_linux_serial.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace postura;

// ---------- small utilities ----------

static std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold  (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim   (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red   (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green (const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
  std::string yellow(const std::string& s) const { return enabled ? "\033[33m"+s+"\033[0m" : s; }
};

static int exit_code_for(Status st) {
  switch (st) {
    case Status::Ok:           return 0;
    case Status::PeerNotFound: return 4;
    case Status::OutOfRange:   return 2;
    default:                   return 1;
  }
}

static int fail(Status st, const std::string& extra = {}) {
  std::cerr << "status=error reason=" << to_string(st);
  if (!extra.empty()) std::cerr << " " << extra;
  std::cerr << "\n";
  return exit_code_for(st);
}

static std::string fmt_wall(uint64_t ms) {
  const std::time_t t = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return os.str();
}

// Prints notices and rings the terminal bell for the alarm.
class ConsoleNotifier : public INotifier {
public:
  explicit ConsoleNotifier(const Ansi& ansi) : ansi_(ansi) {}

  void notice(const std::string& text) override {
    std::lock_guard<std::mutex> lk(mtx_);
    std::cout << ansi_.bold("[notice] ") << text << "\n" << std::flush;
  }

  void play_alarm() override {
    std::lock_guard<std::mutex> lk(mtx_);
    std::cout << '\a' << std::flush;
  }

private:
  Ansi       ansi_;
  std::mutex mtx_;
};

static std::string describe(const Reading& r, const SessionSnapshot& s, const Ansi& ansi) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(1)
     << "dist=" << (r.distance_mm() / 10.0) << "cm";

  const std::string p = to_string(r.posture());
  switch (r.posture()) {
    case PostureState::Correct: os << " posture=" << ansi.green(p);  break;
    case PostureState::Warning: os << " posture=" << ansi.yellow(p); break;
    case PostureState::Bad:
    case PostureState::Alert:   os << " posture=" << ansi.red(p);    break;
  }
  os << " seated=" << (r.seated() ? 1 : 0)
     << " paused=" << (r.paused() ? 1 : 0)
     << " session=" << s.clock << " (" << to_string(s.state) << ")"
     << " alerts=" << s.alert_count;
  return os.str();
}

// "SET GREEN 90" and friends go through the range-checked helpers.
static Status send_cli_command(ConnectionController& ctl, const std::string& cmd) {
  std::istringstream is(cmd);
  std::string verb, what;
  long value = 0;
  is >> verb >> what;
  if (verb == "SET" && (is >> value)) {
    if (what == "GREEN") return ctl.set_green(static_cast<int>(value));
    if (what == "RED")   return ctl.set_red(static_cast<int>(value));
    if (what == "TIME")  return ctl.set_alert_time(static_cast<int>(value));
  }
  return ctl.send_command(cmd);
}

static std::optional<PeerDescriptor> choose_peer(const Config& cfg, const IPeerDirectory& dir) {
  if (!cfg.device.empty()) {
    return PeerDescriptor{fs::path(cfg.device).filename().string(), cfg.device};
  }
  return find_default_peer(dir.list_paired(), cfg.peer_patterns);
}

static ControllerOptions controller_options(const Config& cfg) {
  ControllerOptions o;
  o.envelope.integrity  = cfg.integrity;
  o.envelope.encryption = cfg.encryption;
  o.peer_patterns       = cfg.peer_patterns;
  o.backoff             = BackoffPolicy(cfg.backoff_start_ms, cfg.backoff_cap_ms);
  return o;
}

// ---------- modes ----------

static int run_scan(const Config& cfg, const Ansi& ansi) {
  SerialPeerDirectory dir;
  const auto peers = dir.list_paired();
  const auto def = find_default_peer(peers, cfg.peer_patterns);
  if (peers.empty()) {
    std::cout << ansi.dim("no serial peers found") << "\n";
    return 0;
  }
  for (const auto& p : peers) {
    const bool is_def = def && *def == p;
    std::cout << (is_def ? ansi.bold("* ") : "  ")
              << "name=" << p.name << " dev=" << p.address << "\n";
  }
  return 0;
}

static int run_send(const Config& cfg, const std::string& cmd, int timeout_ms, int settle_ms) {
  ThreadScheduler sched;
  transport::LinuxSerialLink link(cfg.baud, settle_ms);
  SerialPeerDirectory dir;
  ConnectionController ctl(link, dir, sched, controller_options(cfg));

  const auto peer = choose_peer(cfg, dir);
  if (!peer) return fail(Status::PeerNotFound);

  std::mutex mtx;
  std::condition_variable cv;
  std::optional<ControlReply> reply;
  bool pong_seen = false;
  Subscription sub = ctl.replies().subscribe([&](const ControlReply& r) {
    std::lock_guard<std::mutex> lk(mtx);
    // The connect probe answers first; skip exactly one PONG unless we sent PING.
    if (r.kind == LineKind::Pong && !pong_seen && cmd != "PING") {
      pong_seen = true;
      return;
    }
    if (!reply) reply = r;
    cv.notify_all();
  });

  Status st = ctl.connect(*peer);
  if (!ok(st)) {
    sched.stop();
    return fail(st, "dev=" + peer->address);
  }

  st = send_cli_command(ctl, cmd);
  if (!ok(st)) {
    ctl.disconnect();
    sched.stop();
    return fail(st, "cmd=\"" + cmd + "\"");
  }

  bool got = false;
  {
    std::unique_lock<std::mutex> lk(mtx);
    got = cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return reply.has_value(); });
  }
  std::optional<ControlReply> out;
  {
    std::lock_guard<std::mutex> lk(mtx);
    out = reply;
  }
  sub.reset();
  ctl.disconnect();
  sched.stop();

  if (!got || !out) {
    std::cerr << "status=error reason=timeout\n";
    return 3;
  }
  std::cout << out->text << "\n";
  return out->kind == LineKind::Nack ? 1 : 0;
}

static int run_monitor(const Config& cfg, const Ansi& ansi, int settle_ms) {
  const fs::path state_dir = resolve_state_dir(cfg);

  ThreadScheduler sched;
  transport::LinuxSerialLink link(cfg.baud, settle_ms);
  SerialPeerDirectory dir;
  ConnectionController ctl(link, dir, sched, controller_options(cfg));

  JsonFileStore store(state_dir);
  OfflineBuffer buffer(cfg.offline_capacity, state_dir / cfg.owner / "offline.json");
  {
    std::string err;
    if (!buffer.load(err)) log::warn("offline_buffer_load_failed", {{"what", err}});
  }

  ConsoleNotifier notifier(ansi);

  SyncOptions so;
  so.owner              = cfg.owner;
  so.drain_batch        = cfg.drain_batch;
  so.notice_interval_ms = cfg.notice_interval_ms;
  SyncOrchestrator sync(store, buffer, sched, notifier, so);

  SessionOptions eo;
  eo.alert_delay_ms          = cfg.alert_delay_ms;
  eo.break_after_ms          = cfg.break_after_ms;
  eo.resume_on_reconnect_ack = cfg.resume_on_reconnect_ack;
  eo.alarm_enabled           = cfg.alarm;
  eo.owner                   = cfg.owner;
  SessionEngine engine(sched, sync, notifier, eo);

  MonitorOptions mo;
  mo.stale_ms           = cfg.stale_ms;
  mo.notice_interval_ms = cfg.notice_interval_ms;
  Monitor monitor(ctl, engine, sync, sched, notifier, mo);
  monitor.start();

  std::mutex out_mtx;
  Subscription print_sub = ctl.latest().subscribe([&](const std::optional<Reading>& r) {
    if (!r) return;
    const std::string line = describe(*r, engine.snapshot(), ansi);
    std::lock_guard<std::mutex> lk(out_mtx);
    std::cout << line << "\n" << std::flush;
  });
  Subscription state_sub = ctl.state().subscribe([&](const ConnectionState& s) {
    std::lock_guard<std::mutex> lk(out_mtx);
    std::cout << ansi.dim(std::string("[link] ") + to_string(s)) << "\n" << std::flush;
  });

  const auto peer = choose_peer(cfg, dir);
  if (!peer) {
    monitor.stop();
    sched.stop();
    return fail(Status::PeerNotFound);
  }
  const Status st = ctl.connect(*peer);
  if (!ok(st)) {
    std::cerr << "status=warn reason=" << to_string(st) << " dev=" << peer->address << " retrying\n";
    ctl.start_auto_reconnect();
  }

  bool stdin_open = true;
  while (!g_stop.load()) {
    if (!stdin_open) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      continue;
    }
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, 200);
    if (pr <= 0) continue;
    char c = 0;
    if (::read(STDIN_FILENO, &c, 1) != 1) {
      stdin_open = false;
      continue;
    }
    switch (c) {
      case 'p': {
        const Status ps = monitor.toggle_pause();
        if (!ok(ps) && ps != Status::NotConnected && ps != Status::NotFound)
          log::warn("pause_failed", {{"reason", to_string(ps)}});
        break;
      }
      case 'f': {
        const Status fs_ = engine.finalize();
        if (!ok(fs_)) log::debug("finalize_not_done", {{"reason", to_string(fs_)}});
        break;
      }
      case 'r': {
        const Status rs = engine.restart();
        if (!ok(rs)) log::debug("restart_not_saved", {{"reason", to_string(rs)}});
        break;
      }
      case 't': engine.reset_timer(); break;
      case 'a': {
        const bool on = !engine.alarm_enabled();
        const Status as = monitor.set_alarm(on);
        notifier.notice(std::string("Alarm ") + (on ? "on" : "off"));
        if (!ok(as) && as != Status::NotConnected) log::warn("alarm_sync_failed", {{"reason", to_string(as)}});
        break;
      }
      case 'q': g_stop.store(true); break;
      default: break;
    }
  }

  // A user disconnect ends and saves the running session.
  ctl.cancel_auto_reconnect();
  ctl.disconnect();
  print_sub.reset();
  state_sub.reset();
  monitor.stop();
  sched.stop();
  log::info("monitor_stopped", {{"buffered", std::to_string(buffer.size())}});
  return 0;
}

static int run_sessions(const Config& cfg, size_t limit, bool as_json, const Ansi& ansi) {
  ThreadScheduler sched;
  JsonFileStore store(resolve_state_dir(cfg));
  OfflineBuffer buffer(1);
  ConsoleNotifier notifier(ansi);
  SyncOrchestrator sync(store, buffer, sched, notifier, SyncOptions{cfg.owner, cfg.drain_batch, cfg.notice_interval_ms});

  std::vector<SessionRecord> list;
  const Status st = sync.sessions(limit, list);
  sched.stop();
  if (!ok(st)) return fail(st);

  if (as_json) {
    std::cout << json(list).dump(2) << "\n";
    return 0;
  }
  if (list.empty()) {
    std::cout << ansi.dim("no sessions") << "\n";
    return 0;
  }
  for (const auto& r : list) {
    std::cout << ansi.bold(r.id) << "  " << fmt_wall(r.start_ms)
              << "  " << std::left << std::setw(12) << r.format_duration()
              << " alerts=" << r.alert_count
              << (r.break_reminder_shown ? " break" : "") << "\n";
  }
  return 0;
}

static int run_stats(const Config& cfg, bool as_json, const Ansi& ansi) {
  ThreadScheduler sched;
  JsonFileStore store(resolve_state_dir(cfg));
  OfflineBuffer buffer(1);
  ConsoleNotifier notifier(ansi);
  SyncOrchestrator sync(store, buffer, sched, notifier, SyncOptions{cfg.owner, cfg.drain_batch, cfg.notice_interval_ms});

  SessionStats s;
  const Status st = sync.statistics(s);
  sched.stop();
  if (!ok(st)) return fail(st);

  SessionRecord total, avg;
  total.duration_ms = s.total_duration_ms;
  avg.duration_ms   = s.average_duration_ms;
  if (as_json) {
    json j;
    j["totalSessions"]   = s.total_sessions;
    j["totalDurationMs"] = s.total_duration_ms;
    j["totalAlerts"]     = s.total_alerts;
    j["averageDuration"] = s.average_duration_ms;
    j["averageAlerts"]   = s.average_alerts;
    std::cout << j.dump(2) << "\n";
    return 0;
  }
  std::cout << "sessions        " << s.total_sessions << "\n"
            << "total time      " << total.format_duration() << "\n"
            << "total alerts    " << s.total_alerts << "\n"
            << "average time    " << avg.format_duration() << "\n"
            << "average alerts  " << std::fixed << std::setprecision(1) << s.average_alerts << "\n";
  return 0;
}

static int run_delete(const Config& cfg, const std::string& id, const Ansi& ansi) {
  ThreadScheduler sched;
  JsonFileStore store(resolve_state_dir(cfg));
  OfflineBuffer buffer(1);
  ConsoleNotifier notifier(ansi);
  SyncOrchestrator sync(store, buffer, sched, notifier, SyncOptions{cfg.owner, cfg.drain_batch, cfg.notice_interval_ms});

  const Status st = sync.delete_session(id);
  sched.stop();
  if (!ok(st)) return fail(st, "id=" + id);
  std::cout << "deleted " << id << "\n";
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"postura: posture sensor client"};

  // ---- modes ----
  bool do_scan = false, do_monitor = false, do_stats = false, do_save = false;
  std::string send_cmd, delete_id;
  size_t sessions_n = 0;

  // ---- config overrides ----
  std::string config_path, dev, owner, state_dir;
  int baud = 9600;
  bool integrity = false, encryption = false, alarm = true, resume_ack = false;
  std::vector<std::string> patterns;

  // ---- cli-only ----
  int timeout_ms = 3000, settle_ms = 0;
  bool verbose = false, quiet = false, no_color = false;
  std::string format = "pretty";

  app.add_flag("--scan", do_scan, "List serial peers; the default one is marked");
  app.add_option("--send", send_cmd, "Send one command (PING, SET GREEN 90, PAUSE ON, ...)");
  app.add_flag("--monitor", do_monitor, "Connect and monitor until interrupted");
  auto* opt_sessions = app.add_option("--sessions", sessions_n, "List the last N sessions");
  app.add_flag("--stats", do_stats, "Session statistics");
  app.add_option("--delete-session", delete_id, "Delete a stored session by id");
  app.add_flag("--save-config", do_save, "Write the effective configuration and exit");

  app.add_option("--config", config_path, "Config file (default $XDG_CONFIG_HOME/postura/config.json)");
  auto* opt_dev       = app.add_option("--dev", dev, "Serial device (e.g. /dev/rfcomm0)");
  auto* opt_baud      = app.add_option("--baud", baud, "Baud rate (default 9600)");
  auto* opt_owner     = app.add_option("--owner", owner, "Owner id for stored data");
  auto* opt_state     = app.add_option("--state-dir", state_dir, "Override data directory");
  auto* opt_integrity = app.add_flag("--integrity,!--no-integrity", integrity, "CRC-16 envelope on the wire");
  auto* opt_encrypt   = app.add_flag("--encryption,!--no-encryption", encryption, "XOR+base64 envelope on the wire");
  auto* opt_alarm     = app.add_flag("--alarm,!--no-alarm", alarm, "Posture alarm");
  auto* opt_resume    = app.add_flag("--resume-on-ack,!--no-resume-on-ack", resume_ack,
                                     "Resume a loss-paused session when the sensor answers after reconnecting");
  auto* opt_patterns  = app.add_option("--peer-pattern", patterns, "Name pattern for the default peer (repeatable)");

  app.add_option("--timeout", timeout_ms, "Reply timeout for --send (ms)")->check(CLI::PositiveNumber);
  app.add_option("--settle-ms", settle_ms, "Delay after open before first write (ms)")->check(CLI::NonNegativeNumber);
  app.add_flag("-v,--verbose", verbose, "Debug logging");
  app.add_flag("-q,--quiet", quiet, "Errors only");
  app.add_flag("--no-color", no_color, "Disable ANSI colors");
  app.add_option("--format", format, "Output format for --sessions/--stats: pretty|json")
     ->check(CLI::IsMember({"pretty", "json"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  log::set_level(verbose ? log::Level::Debug : quiet ? log::Level::Error : log::Level::Info);

  Ansi ansi;
  ansi.enabled = !no_color && is_tty_stdout() && format == "pretty";

  // ---- config: defaults <- file <- flags ----
  const fs::path cfg_path = config_path.empty() ? default_config_path() : fs::path(config_path);
  Config cfg;
  {
    std::string err;
    if (!load_config(cfg_path, cfg, err)) {
      std::cerr << ansi.red("error: ") << err << "\n";
      return 2;
    }
  }
  if (opt_dev->count())       cfg.device = dev;
  if (opt_baud->count())      cfg.baud = baud;
  if (opt_owner->count())     cfg.owner = owner;
  if (opt_state->count())     cfg.state_dir = state_dir;
  if (opt_integrity->count()) cfg.integrity = integrity;
  if (opt_encrypt->count())   cfg.encryption = encryption;
  if (opt_alarm->count())     cfg.alarm = alarm;
  if (opt_resume->count())    cfg.resume_on_reconnect_ack = resume_ack;
  if (opt_patterns->count())  cfg.peer_patterns = patterns;
  {
    std::string err;
    if (!validate_config(cfg, err)) {
      std::cerr << ansi.red("error: ") << err << "\n";
      return 2;
    }
  }

  if (do_save) {
    std::string err;
    if (!save_config(cfg_path, cfg, err)) {
      std::cerr << "status=error reason=config_write_failed what=\"" << err << "\"\n";
      return 1;
    }
    std::cout << "saved " << cfg_path.string() << "\n";
    return 0;
  }

  int modes = 0;
  modes += do_scan ? 1 : 0;
  modes += send_cmd.empty() ? 0 : 1;
  modes += do_monitor ? 1 : 0;
  modes += opt_sessions->count() ? 1 : 0;
  modes += do_stats ? 1 : 0;
  modes += delete_id.empty() ? 0 : 1;
  if (modes != 1) {
    std::cerr << "status=error reason=need_exactly_one_mode\n";
    return 2;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  const bool as_json = (format == "json");
  if (do_scan)                 return run_scan(cfg, ansi);
  if (!send_cmd.empty())       return run_send(cfg, send_cmd, timeout_ms, settle_ms);
  if (do_monitor)              return run_monitor(cfg, ansi, settle_ms);
  if (opt_sessions->count())   return run_sessions(cfg, sessions_n, as_json, ansi);
  if (do_stats)                return run_stats(cfg, as_json, ansi);
  return run_delete(cfg, delete_id, ansi);
}
