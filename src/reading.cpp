/**
 * @file reading.cpp
 * @brief PostureState derivation and JSON mapping for Reading.
 *
 * Refer to `reading.hpp` for the precedence rules.
 */
#include "postura/reading.hpp"

namespace postura {

const char* to_string(PostureState s) {
  switch (s) {
    case PostureState::Correct: return "correct";
    case PostureState::Warning: return "warning";
    case PostureState::Bad:     return "bad";
    case PostureState::Alert:   return "alert";
  }
  return "correct";
}

PostureState Reading::posture() const {
  // Device flags first, in the order the firmware lights its LEDs.
  if (paused_)       return PostureState::Correct;
  if (alert_active_) return PostureState::Alert;
  if (bad_posture_)  return PostureState::Bad;

  // Nobody in the chair, or no echo: nothing to judge.
  if (!seated_ || distance_mm_ == 0) return PostureState::Correct;

  // Yellow band is the only zone the host computes itself.
  if (distance_mm_ > green_mm_ && distance_mm_ <= red_mm_) return PostureState::Warning;

  return PostureState::Correct;
}

void to_json(nlohmann::json& j, const Reading& r) {
  j = nlohmann::json{
    {"distancia",    r.distance_mm()},
    {"sentado",      r.seated()},
    {"malaPostura",  r.bad_posture()},
    {"alertaActiva", r.alert_active()},
    {"umbralVerde",  r.green_mm()},
    {"umbralRojo",   r.red_mm()},
    {"pausado",      r.paused()},
    {"timestamp",    r.timestamp_ms()},
  };
}

void from_json(const nlohmann::json& j, Reading& r) {
  r = Reading(j.value("distancia", 0),
              j.value("sentado", false),
              j.value("malaPostura", false),
              j.value("alertaActiva", false),
              j.value("umbralVerde", GREEN_DEFAULT_MM),
              j.value("umbralRojo", RED_DEFAULT_MM),
              j.value("pausado", false),
              j.value("timestamp", uint64_t{0}));
}

} // namespace postura
