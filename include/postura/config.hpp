#pragma once
/**
 * @file config.hpp
 * @brief User configuration: defaults, JSON file under XDG config, validation.
 *
 * @details
 * Location: `$XDG_CONFIG_HOME/postura/config.json`, falling back to
 * `~/.config/postura/config.json`. Keys match the field names below.
 * Unknown keys are ignored so older binaries read newer files. A known key
 * with the wrong type or an out-of-range value fails the whole load with a
 * reason; the CLI reports it and exits.
 *
 * Example:
 * @code
 *   {
 *     "device": "/dev/rfcomm0",
 *     "owner": "maria",
 *     "integrity": true,
 *     "peer_patterns": ["HC-06", "POSTURA"]
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace postura {

struct Config {
  std::string device;                   ///< empty: pick the default peer
  int         baud{9600};
  std::string owner{"local"};
  std::string state_dir;                ///< empty: <config dir>/data
  bool        integrity{false};
  bool        encryption{false};
  bool        alarm{true};
  std::vector<std::string> peer_patterns{"HC-06", "HC-05"};

  uint64_t stale_ms{6000};
  uint64_t backoff_start_ms{3000};
  uint64_t backoff_cap_ms{30000};
  uint64_t alert_delay_ms{5000};
  uint64_t break_after_ms{3600000};
  size_t   offline_capacity{500};
  size_t   drain_batch{20};
  uint64_t notice_interval_ms{10000};
  bool     resume_on_reconnect_ack{false};
};

/// $XDG_CONFIG_HOME/postura or ~/.config/postura
std::filesystem::path default_config_dir();
std::filesystem::path default_config_path();

/// state_dir if set, else <config dir>/data.
std::filesystem::path resolve_state_dir(const Config& cfg);

/// Overlay keys of @p j onto @p cfg. False with a reason on a bad value.
bool config_from_json(const nlohmann::json& j, Config& cfg, std::string& err);
nlohmann::json config_to_json(const Config& cfg);

/// Cross-field and range checks.
bool validate_config(const Config& cfg, std::string& err);

/// A missing file leaves @p cfg at its defaults and returns true.
bool load_config(const std::filesystem::path& p, Config& cfg, std::string& err);
bool save_config(const std::filesystem::path& p, const Config& cfg, std::string& err);

} // namespace postura
