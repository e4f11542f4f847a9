// ============================================================================
// json_file_store.cpp: JsonFileStore (see store.hpp)
// ============================================================================

#include "postura/store.hpp"
#include "postura/json_file.hpp"
#include "postura/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace postura {

namespace {

constexpr const char* CURRENT_FILE  = "current.json";
constexpr const char* HISTORY_FILE  = "history.json";
constexpr const char* SESSIONS_FILE = "sessions.json";

uint64_t wall_now_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// Load an array file; a missing file is an empty array.
bool load_array(const fs::path& p, json& out, std::string& err) {
  json j;
  if (!read_json_file(p, j, err)) {
    if (!err.empty()) return false;
    out = json::array();
    return true;
  }
  if (!j.is_array()) {
    err = "expected array in " + p.string();
    return false;
  }
  out = std::move(j);
  return true;
}

// Decode the object entries of @p arr, skipping any that do not fit T.
template <typename T>
void decode_entries(const json& arr, size_t first, const fs::path& p, std::vector<T>& out) {
  std::string err;
  for (size_t i = first; i < arr.size(); ++i) {
    T v;
    if (!decode_entry(arr[i], v, err)) {
      log::warn("store_entry_skipped", {{"file", p.string()}, {"index", std::to_string(i)}, {"what", err}});
      continue;
    }
    out.push_back(std::move(v));
  }
}

void sort_recent_first(std::vector<SessionRecord>& v) {
  std::stable_sort(v.begin(), v.end(), [](const SessionRecord& a, const SessionRecord& b) {
    return a.start_ms > b.start_ms;
  });
}

} // namespace

bool valid_owner(const std::string& owner) {
  if (owner.empty() || owner == "." || owner == "..") return false;
  for (char c : owner) {
    const bool okc = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                     (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
    if (!okc) return false;
  }
  return true;
}

JsonFileStore::JsonFileStore(fs::path root, size_t history_cap)
: root_(std::move(root)), history_cap_(history_cap ? history_cap : 1) {}

JsonFileStore::Streams& JsonFileStore::streams_locked(const std::string& owner) {
  auto& slot = streams_[owner];
  if (!slot) slot = std::make_unique<Streams>();
  return *slot;
}

// Time-ordered id: 12 hex digits of wall ms + 4 hex digits of sequence.
std::string JsonFileStore::next_id_locked() {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%012llx%04x",
                static_cast<unsigned long long>(wall_now_ms()),
                static_cast<unsigned>(id_seq_++ & 0xFFFF));
  return buf;
}

std::optional<Reading> JsonFileStore::load_current_locked(const std::string& owner) {
  json j;
  std::string err;
  if (!read_json_file(dir(owner) / CURRENT_FILE, j, err)) {
    if (!err.empty()) log::warn("store_read_failed", {{"what", err}});
    return std::nullopt;
  }
  if (j.is_null()) return std::nullopt;
  Reading r;
  if (!decode_entry(j, r, err)) {
    log::warn("store_entry_skipped", {{"file", (dir(owner) / CURRENT_FILE).string()}, {"what", err}});
    return std::nullopt;
  }
  return r;
}

Status JsonFileStore::load_sessions_locked(const std::string& owner, std::vector<SessionRecord>& out) {
  json arr;
  std::string err;
  const fs::path p = dir(owner) / SESSIONS_FILE;
  if (!load_array(p, arr, err)) {
    log::warn("store_read_failed", {{"what", err}});
    return Status::NotFound;
  }
  out.clear();
  decode_entries(arr, 0, p, out);
  sort_recent_first(out);
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// posture/current
// ---------------------------------------------------------------------------

Status JsonFileStore::write_current(const std::string& owner, const Reading& r) {
  if (!valid_owner(owner)) return Status::RemoteWriteFailed;
  std::string err;
  EventStream<std::optional<Reading>>* stream = nullptr;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!atomic_write_json(dir(owner) / CURRENT_FILE, json(r), err)) {
      log::warn("store_write_failed", {{"what", err}});
      return Status::RemoteWriteFailed;
    }
    stream = &streams_locked(owner).current;
  }
  stream->publish(std::optional<Reading>(r));
  return Status::Ok;
}

Status JsonFileStore::clear_current(const std::string& owner) {
  if (!valid_owner(owner)) return Status::RemoteWriteFailed;
  std::string err;
  EventStream<std::optional<Reading>>* stream = nullptr;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!atomic_write_json(dir(owner) / CURRENT_FILE, json(nullptr), err)) {
      log::warn("store_write_failed", {{"what", err}});
      return Status::RemoteWriteFailed;
    }
    stream = &streams_locked(owner).current;
  }
  stream->publish(std::nullopt);
  return Status::Ok;
}

Subscription JsonFileStore::subscribe_current(const std::string& owner, CurrentCallback cb) {
  std::optional<Reading> now;
  EventStream<std::optional<Reading>>* stream = nullptr;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (valid_owner(owner)) now = load_current_locked(owner);
    stream = &streams_locked(owner).current;
  }
  cb(now);
  return stream->subscribe(std::move(cb));
}

// ---------------------------------------------------------------------------
// posture/history
// ---------------------------------------------------------------------------

Status JsonFileStore::append_history(const std::string& owner, const Reading& r, std::string& id) {
  if (!valid_owner(owner)) return Status::RemoteWriteFailed;
  std::lock_guard<std::mutex> lk(mtx_);

  const fs::path p = dir(owner) / HISTORY_FILE;
  json arr;
  std::string err;
  if (!load_array(p, arr, err)) {
    log::warn("store_read_failed", {{"what", err}});
    return Status::RemoteWriteFailed;
  }

  const std::string new_id = next_id_locked();
  json entry = r;
  entry["id"] = new_id;
  arr.push_back(std::move(entry));
  if (arr.size() > history_cap_) {
    arr.erase(arr.begin(), arr.begin() + static_cast<std::ptrdiff_t>(arr.size() - history_cap_));
  }

  if (!atomic_write_json(p, arr, err)) {
    log::warn("store_write_failed", {{"what", err}});
    return Status::RemoteWriteFailed;
  }
  id = new_id;
  return Status::Ok;
}

Status JsonFileStore::read_history(const std::string& owner, size_t limit, std::vector<Reading>& out) {
  if (!valid_owner(owner)) return Status::NotFound;
  std::lock_guard<std::mutex> lk(mtx_);

  const fs::path p = dir(owner) / HISTORY_FILE;
  json arr;
  std::string err;
  if (!load_array(p, arr, err)) {
    log::warn("store_read_failed", {{"what", err}});
    return Status::NotFound;
  }
  out.clear();
  const size_t n = arr.size();
  decode_entries(arr, (limit < n) ? n - limit : 0, p, out);
  return Status::Ok;
}

// ---------------------------------------------------------------------------
// sessions
// ---------------------------------------------------------------------------

Status JsonFileStore::save_session(const std::string& owner, SessionRecord& rec) {
  if (!valid_owner(owner)) return Status::RemoteWriteFailed;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    const fs::path p = dir(owner) / SESSIONS_FILE;
    json arr;
    std::string err;
    if (!load_array(p, arr, err)) {
      log::warn("store_read_failed", {{"what", err}});
      return Status::RemoteWriteFailed;
    }

    SessionRecord stored = rec;
    if (stored.id.empty()) stored.id = next_id_locked();
    stored.owner = owner;

    // Same id overwrites in place.
    bool replaced = false;
    for (auto& e : arr) {
      if (string_member(e, "sessionId") == stored.id) {
        e = stored;
        replaced = true;
        break;
      }
    }
    if (!replaced) arr.push_back(stored);

    if (!atomic_write_json(p, arr, err)) {
      log::warn("store_write_failed", {{"what", err}});
      return Status::RemoteWriteFailed;
    }
    rec = stored;
  }
  publish_sessions(owner);
  return Status::Ok;
}

Status JsonFileStore::list_sessions(const std::string& owner, size_t limit, std::vector<SessionRecord>& out) {
  if (!valid_owner(owner)) return Status::NotFound;
  std::lock_guard<std::mutex> lk(mtx_);
  const Status st = load_sessions_locked(owner, out);
  if (ok(st) && out.size() > limit) out.resize(limit);
  return st;
}

Subscription JsonFileStore::subscribe_sessions(const std::string& owner, size_t limit, SessionsCallback cb) {
  auto limited = [limit, cb](const std::vector<SessionRecord>& all) {
    if (all.size() <= limit) {
      cb(all);
      return;
    }
    cb(std::vector<SessionRecord>(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(limit)));
  };

  std::vector<SessionRecord> now;
  EventStream<std::vector<SessionRecord>>* stream = nullptr;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (valid_owner(owner) && !ok(load_sessions_locked(owner, now))) now.clear();
    stream = &streams_locked(owner).sessions;
  }
  limited(now);
  return stream->subscribe(std::move(limited));
}

Status JsonFileStore::delete_session(const std::string& owner, const std::string& id) {
  if (!valid_owner(owner)) return Status::NotFound;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    const fs::path p = dir(owner) / SESSIONS_FILE;
    json arr;
    std::string err;
    if (!load_array(p, arr, err)) {
      log::warn("store_read_failed", {{"what", err}});
      return Status::RemoteWriteFailed;
    }

    const auto before = arr.size();
    json kept = json::array();
    for (auto& e : arr) {
      if (string_member(e, "sessionId") == id) continue;
      kept.push_back(std::move(e));
    }
    if (kept.size() == before) return Status::NotFound;

    if (!atomic_write_json(p, kept, err)) {
      log::warn("store_write_failed", {{"what", err}});
      return Status::RemoteWriteFailed;
    }
  }
  log::info("session_deleted", {{"id", id}});
  publish_sessions(owner);
  return Status::Ok;
}

void JsonFileStore::publish_sessions(const std::string& owner) {
  std::vector<SessionRecord> all;
  EventStream<std::vector<SessionRecord>>* stream = nullptr;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!ok(load_sessions_locked(owner, all))) return;
    stream = &streams_locked(owner).sessions;
  }
  stream->publish(all);
}

} // namespace postura
