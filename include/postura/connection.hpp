#pragma once
/**
 * @file connection.hpp
 * @brief Connection lifecycle: connect, continuous read, loss, backoff reconnection, commands.
 *
 * @details
 * STATE MACHINE
 * -------------
 *   Disconnected --connect()--> Connecting --open ok--> Connected
 *        ^                          |                      |
 *        +------- open failed ------+    read/write fail,  |
 *        +------------------------------ disconnect(), ----+
 *                                        drop()
 *
 * The controller is the only writer of every observable it exposes.
 *
 * THREADS
 * -------
 * - connect()/disconnect()/send_command() run on the caller's thread and
 *   may block on the link.
 * - Each connection gets one reader thread. It publishes Readings and control
 *   replies in arrival order. When the stream fails the reader tears the
 *   connection down itself (close only, it cannot join itself); every other
 *   teardown interrupts the reader and joins it before closing the link.
 * - Auto-reconnect attempts run as tasks on the scheduler.
 *
 * Observable callbacks run on whichever of these threads made the change.
 * They must not call connect()/disconnect()/drop() synchronously; schedule
 * the call instead.
 *
 * RECONNECTION
 * ------------
 * `start_auto_reconnect()` tries at once, then after the k-th consecutive
 * failure waits min(start * 2^(k-1), cap). Defaults give
 * 3000, 6000, 12000, 24000, 30000, 30000, ... ms. It stops on success, on a
 * manual disconnect, or when cancelled.
 */

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "postura/envelope.hpp"
#include "postura/observable.hpp"
#include "postura/peer_registry.hpp"
#include "postura/reading.hpp"
#include "postura/scheduler.hpp"
#include "postura/status.hpp"
#include "postura/status_line.hpp"
#include "postura/transport/link_base.hpp"

namespace postura {

enum class ConnectionState : uint8_t { Disconnected, Connecting, Connected };

const char* to_string(ConnectionState s);

enum class PauseCommand : uint8_t { On, Off, Toggle };

// Firmware-accepted ranges; checked locally before anything is sent.
static constexpr int GREEN_MIN_MM      = 60;
static constexpr int GREEN_MAX_MM      = 200;
static constexpr int RED_MIN_MM        = 80;
static constexpr int RED_MAX_MM        = 400;
static constexpr int ALERT_TIME_MIN_MS = 5000;
static constexpr int ALERT_TIME_MAX_MS = 300000;

class BackoffPolicy {
public:
  explicit BackoffPolicy(uint64_t start_ms = 3000, uint64_t cap_ms = 30000)
  : start_ms_(start_ms), cap_ms_(cap_ms) {}

  /// Wait before the next attempt after @p failures consecutive failures (0 -> 0).
  uint64_t delay_after(unsigned failures) const;

  uint64_t start_ms() const { return start_ms_; }
  uint64_t cap_ms() const { return cap_ms_; }

private:
  uint64_t start_ms_;
  uint64_t cap_ms_;
};

struct ControllerOptions {
  envelope::EnvelopeOptions envelope{};
  std::vector<std::string>  peer_patterns = default_peer_patterns();
  BackoffPolicy             backoff{};
};

class ConnectionController {
public:
  ConnectionController(transport::ILink& link, IPeerDirectory& peers, IScheduler& sched,
                       ControllerOptions opt = {});
  ~ConnectionController();

  ConnectionController(const ConnectionController&) = delete;
  ConnectionController& operator=(const ConnectionController&) = delete;

  // --- peers ---------------------------------------------------------------
  std::vector<PeerDescriptor>   list_paired() const;
  std::optional<PeerDescriptor> find_default_peer() const;

  // --- lifecycle -----------------------------------------------------------
  Status connect(const PeerDescriptor& peer);
  /// User-initiated. Suppresses auto-reconnect until the next connect().
  void   disconnect();
  /// Involuntary teardown (watchdog, write failure). No-op unless Connected.
  void   drop(const std::string& reason);
  /// Last address if still listed, else the default peer.
  Status reconnect();

  void start_auto_reconnect();
  void cancel_auto_reconnect();

  bool manually_disconnected() const { return manual_.load(); }
  std::optional<std::string> last_address() const;
  /// Monotonic ms of the last successful connect, 0 if never connected.
  uint64_t connected_since() const { return connected_since_.load(); }

  // --- commands ------------------------------------------------------------
  Status send_command(const std::string& cmd);
  Status set_green(int mm);
  Status set_red(int mm);
  Status set_alert_time(int ms);
  Status set_alarm(bool on);
  Status set_pause(PauseCommand cmd);
  Status ping();

  void set_envelope_options(const envelope::EnvelopeOptions& opt);
  envelope::EnvelopeOptions envelope_options() const;

  // --- observables ---------------------------------------------------------
  Observable<ConnectionState>&             state()           { return state_; }
  Observable<std::optional<Reading>>&      latest()          { return latest_; }
  Observable<std::optional<uint64_t>>&     last_reading_at() { return last_reading_at_; }
  Observable<std::optional<std::string>>&  last_error()      { return last_error_; }
  Observable<bool>&                        reconnecting()    { return reconnecting_; }
  EventStream<ControlReply>&               replies()         { return replies_; }

private:
  void reader_loop(uint64_t gen);
  void handle_line(const std::string& raw);
  void on_reader_failure(uint64_t gen, Status st);

  // Caller holds lifecycle_mtx_.
  void teardown_locked(bool from_reader);
  void mark_disconnected_locked(const std::optional<std::string>& reason);

  // from_auto: refuse to open once a user disconnect has been requested.
  Status open_peer(const PeerDescriptor& peer, bool from_auto);
  Status reconnect_to_known(bool from_auto);
  void reconnect_step();

  transport::ILink& link_;
  IPeerDirectory&   peers_;
  IScheduler&       sched_;
  std::vector<std::string> patterns_;
  BackoffPolicy     backoff_;

  mutable std::mutex        env_mtx_;
  envelope::EnvelopeOptions envelope_;

  std::timed_mutex      lifecycle_mtx_;
  std::mutex            io_mtx_;      // link write vs. link close
  std::thread           reader_;
  std::atomic<uint64_t> active_gen_{0};
  uint64_t              next_gen_{1};
  std::atomic<bool>     manual_{false};
  std::atomic<uint64_t> connected_since_{0};

  mutable std::mutex         addr_mtx_;
  std::optional<std::string> last_address_;

  std::mutex reconnect_mtx_;
  bool       reconnect_active_{false};
  TaskId     reconnect_task_{NO_TASK};
  unsigned   failures_{0};

  Observable<ConnectionState>            state_{ConnectionState::Disconnected};
  Observable<std::optional<Reading>>     latest_;
  Observable<std::optional<uint64_t>>    last_reading_at_;
  Observable<std::optional<std::string>> last_error_;
  Observable<bool>                       reconnecting_{false};
  EventStream<ControlReply>              replies_;
};

} // namespace postura
