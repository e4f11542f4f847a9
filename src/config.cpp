// ============================================================================
// config.cpp: Config load/save/validate (see config.hpp)
// ============================================================================

#include "postura/config.hpp"
#include "postura/connection.hpp"
#include "postura/json_file.hpp"
#include "postura/offline_buffer.hpp"
#include "postura/store.hpp"
#include "postura/transport/link_linux_serial.hpp"

#include <cstdlib>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace postura {

namespace {

bool take_bool(const json& j, const char* key, bool& dst, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) { err = std::string(key) + ": expected boolean"; return false; }
  dst = it->get<bool>();
  return true;
}

bool take_string(const json& j, const char* key, std::string& dst, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) { err = std::string(key) + ": expected string"; return false; }
  dst = it->get<std::string>();
  return true;
}

template <typename U>
bool take_uint(const json& j, const char* key, U& dst, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_unsigned()) { err = std::string(key) + ": expected non-negative integer"; return false; }
  dst = it->get<U>();
  return true;
}

bool take_int(const json& j, const char* key, int& dst, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) { err = std::string(key) + ": expected integer"; return false; }
  dst = it->get<int>();
  return true;
}

bool take_strings(const json& j, const char* key, std::vector<std::string>& dst, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_array()) { err = std::string(key) + ": expected array of strings"; return false; }
  std::vector<std::string> out;
  for (const auto& e : *it) {
    if (!e.is_string()) { err = std::string(key) + ": expected array of strings"; return false; }
    out.push_back(e.get<std::string>());
  }
  dst = std::move(out);
  return true;
}

} // namespace

fs::path default_config_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "postura";
  const char* home = std::getenv("HOME");
  fs::path base = (home && *home) ? fs::path(home) : fs::path(".");
  return base / ".config" / "postura";
}

fs::path default_config_path() { return default_config_dir() / "config.json"; }

fs::path resolve_state_dir(const Config& cfg) {
  return cfg.state_dir.empty() ? default_config_dir() / "data" : fs::path(cfg.state_dir);
}

bool config_from_json(const json& j, Config& cfg, std::string& err) {
  err.clear();
  if (!j.is_object()) { err = "config: expected object"; return false; }

  Config c = cfg;
  const bool good =
      take_string (j, "device",                  c.device,                  err) &&
      take_int    (j, "baud",                    c.baud,                    err) &&
      take_string (j, "owner",                   c.owner,                   err) &&
      take_string (j, "state_dir",               c.state_dir,               err) &&
      take_bool   (j, "integrity",               c.integrity,               err) &&
      take_bool   (j, "encryption",              c.encryption,              err) &&
      take_bool   (j, "alarm",                   c.alarm,                   err) &&
      take_strings(j, "peer_patterns",           c.peer_patterns,           err) &&
      take_uint   (j, "stale_ms",                c.stale_ms,                err) &&
      take_uint   (j, "backoff_start_ms",        c.backoff_start_ms,        err) &&
      take_uint   (j, "backoff_cap_ms",          c.backoff_cap_ms,          err) &&
      take_uint   (j, "alert_delay_ms",          c.alert_delay_ms,          err) &&
      take_uint   (j, "break_after_ms",          c.break_after_ms,          err) &&
      take_uint   (j, "offline_capacity",        c.offline_capacity,        err) &&
      take_uint   (j, "drain_batch",             c.drain_batch,             err) &&
      take_uint   (j, "notice_interval_ms",      c.notice_interval_ms,      err) &&
      take_bool   (j, "resume_on_reconnect_ack", c.resume_on_reconnect_ack, err);
  if (!good) return false;
  if (!validate_config(c, err)) return false;
  cfg = std::move(c);
  return true;
}

json config_to_json(const Config& c) {
  json j;
  j["device"]                  = c.device;
  j["baud"]                    = c.baud;
  j["owner"]                   = c.owner;
  j["state_dir"]               = c.state_dir;
  j["integrity"]               = c.integrity;
  j["encryption"]              = c.encryption;
  j["alarm"]                   = c.alarm;
  j["peer_patterns"]           = c.peer_patterns;
  j["stale_ms"]                = c.stale_ms;
  j["backoff_start_ms"]        = c.backoff_start_ms;
  j["backoff_cap_ms"]          = c.backoff_cap_ms;
  j["alert_delay_ms"]          = c.alert_delay_ms;
  j["break_after_ms"]          = c.break_after_ms;
  j["offline_capacity"]        = c.offline_capacity;
  j["drain_batch"]             = c.drain_batch;
  j["notice_interval_ms"]      = c.notice_interval_ms;
  j["resume_on_reconnect_ack"] = c.resume_on_reconnect_ack;
  return j;
}

bool validate_config(const Config& c, std::string& err) {
  err.clear();
  if (!transport::is_supported_baud(c.baud)) {
    err = "baud: unsupported rate " + std::to_string(c.baud);
  } else if (!valid_owner(c.owner)) {
    err = "owner: use letters, digits, '_', '-' or '.'";
  } else if (c.peer_patterns.empty()) {
    err = "peer_patterns: at least one pattern required";
  } else if (c.stale_ms == 0) {
    err = "stale_ms: must be positive";
  } else if (c.backoff_start_ms == 0 || c.backoff_start_ms > c.backoff_cap_ms) {
    err = "backoff_start_ms: must be positive and not above backoff_cap_ms";
  } else if (c.alert_delay_ms < static_cast<uint64_t>(ALERT_TIME_MIN_MS) ||
             c.alert_delay_ms > static_cast<uint64_t>(ALERT_TIME_MAX_MS)) {
    err = "alert_delay_ms: outside " + std::to_string(ALERT_TIME_MIN_MS) + ".." +
          std::to_string(ALERT_TIME_MAX_MS);
  } else if (c.break_after_ms == 0) {
    err = "break_after_ms: must be positive";
  } else if (c.offline_capacity == 0 || c.offline_capacity > OFFLINE_MAX_CAPACITY) {
    err = "offline_capacity: outside 1.." + std::to_string(OFFLINE_MAX_CAPACITY);
  } else if (c.drain_batch == 0) {
    err = "drain_batch: must be positive";
  }
  return err.empty();
}

bool load_config(const fs::path& p, Config& cfg, std::string& err) {
  json j;
  if (!read_json_file(p, j, err)) return err.empty();
  if (!config_from_json(j, cfg, err)) {
    err = p.string() + ": " + err;
    return false;
  }
  return true;
}

bool save_config(const fs::path& p, const Config& cfg, std::string& err) {
  if (!validate_config(cfg, err)) return false;
  return atomic_write_json(p, config_to_json(cfg), err);
}

} // namespace postura
