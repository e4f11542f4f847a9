/**
 * @file reading.hpp
 * @brief Reading: one decoded status snapshot from the sensor, plus its PostureState.
 *
 * @details
 * A `Reading` is what one status line becomes after the envelope and parser
 * are done with it:
 * @code
 *   DIST:150,SENT:1,BAD:0,ALR:0,GREEN:80,RED:120,PAUS:0
 * @endcode
 *
 * Fields mirror the line one-to-one, plus the host-side capture timestamp.
 * Readings are values: construct once, copy freely, never mutate. The
 * timestamp feeds staleness detection (watchdog) and nothing else.
 *
 * ### PostureState
 * `posture()` is a pure function evaluated in a fixed order:
 *   1. paused                        -> Correct
 *   2. alert flag (ALR:1)            -> Alert
 *   3. bad flag (BAD:1)              -> Bad
 *   4. not seated or distance == 0   -> Correct
 *   5. green < distance <= red       -> Warning
 *   6. otherwise                     -> Correct
 *
 * The firmware drives the LEDs from its own flags. Checking the flags first
 * means the host never shows a colour the device is not showing. Only the
 * yellow band is recomputed locally because the firmware has no flag for it.
 *
 * ### Persistence
 * Readings are stored as JSON objects with the field names the store has
 * always used (`distancia`, `sentado`, `malaPostura`, `alertaActiva`,
 * `umbralVerde`, `umbralRojo`, `pausado`, `timestamp`). Missing keys fall
 * back to the same defaults the parser uses.
 */
#ifndef POSTURA_READING_HPP
#define POSTURA_READING_HPP

#include <cstdint>
#include <nlohmann/json.hpp>

namespace postura {

/// Defaults applied when a threshold is absent from the line or record.
static constexpr int GREEN_DEFAULT_MM = 80;
static constexpr int RED_DEFAULT_MM   = 120;

enum class PostureState : uint8_t {
  Correct,   ///< green, or nothing to judge
  Warning,   ///< between thresholds (yellow)
  Bad,       ///< device says BAD:1
  Alert,     ///< device says ALR:1 (sustained bad posture)
};

const char* to_string(PostureState s);

/// Bad or Alert: the states that arm the bad-posture timer.
inline bool is_bad(PostureState s) { return s == PostureState::Bad || s == PostureState::Alert; }

class Reading {
public:
  Reading() = default;

  Reading(int distance_mm, bool seated, bool bad_posture, bool alert_active,
          int green_mm, int red_mm, bool paused, uint64_t timestamp_ms)
  : distance_mm_(distance_mm), seated_(seated), bad_posture_(bad_posture),
    alert_active_(alert_active), green_mm_(green_mm), red_mm_(red_mm),
    paused_(paused), timestamp_ms_(timestamp_ms) {}

  int      distance_mm()  const { return distance_mm_; }
  int      distance_cm()  const { return distance_mm_ / 10; }
  bool     seated()       const { return seated_; }
  bool     bad_posture()  const { return bad_posture_; }
  bool     alert_active() const { return alert_active_; }
  int      green_mm()     const { return green_mm_; }
  int      red_mm()       const { return red_mm_; }
  bool     paused()       const { return paused_; }
  uint64_t timestamp_ms() const { return timestamp_ms_; }

  /// Derived state; see file header for the precedence rules.
  PostureState posture() const;

  /// Same reading, different capture time (used when re-stamping on receipt).
  Reading with_timestamp(uint64_t ts) const {
    Reading r = *this;
    r.timestamp_ms_ = ts;
    return r;
  }

  bool operator==(const Reading& o) const {
    return distance_mm_ == o.distance_mm_ && seated_ == o.seated_ &&
           bad_posture_ == o.bad_posture_ && alert_active_ == o.alert_active_ &&
           green_mm_ == o.green_mm_ && red_mm_ == o.red_mm_ &&
           paused_ == o.paused_ && timestamp_ms_ == o.timestamp_ms_;
  }
  bool operator!=(const Reading& o) const { return !(*this == o); }

private:
  int      distance_mm_{0};
  bool     seated_{false};
  bool     bad_posture_{false};
  bool     alert_active_{false};
  int      green_mm_{GREEN_DEFAULT_MM};
  int      red_mm_{RED_DEFAULT_MM};
  bool     paused_{false};
  uint64_t timestamp_ms_{0};
};

// nlohmann::json ADL hooks (store records and the offline buffer file).
void to_json(nlohmann::json& j, const Reading& r);
void from_json(const nlohmann::json& j, Reading& r);

} // namespace postura

#endif // POSTURA_READING_HPP
