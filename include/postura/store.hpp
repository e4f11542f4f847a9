#pragma once
/**
 * @file store.hpp
 * @brief Persistence interface for readings and sessions, plus a JSON file implementation.
 *
 * @details
 * The store is keyed by owner id and mirrors a simple tree:
 *
 *   users/{owner}/posture/current        latest reading (or absent)
 *   users/{owner}/posture/history/{id}   appended readings
 *   users/{owner}/sessions/{id}          finished sessions
 *
 * Every call may fail; write failures come back as RemoteWriteFailed so the
 * sync layer can buffer and retry. Listeners are `Subscription`s and stop when
 * the handle is dropped.
 *
 * `JsonFileStore` keeps that tree on local disk:
 *
 *   <root>/<owner>/current.json    object, or null when cleared
 *   <root>/<owner>/history.json    array, oldest first, capped
 *   <root>/<owner>/sessions.json   array in save order
 *
 * Every write replaces the whole file atomically. Fine for one user at 2 Hz.
 */

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "postura/observable.hpp"
#include "postura/reading.hpp"
#include "postura/session.hpp"
#include "postura/status.hpp"

namespace postura {

class IPostureStore {
public:
  using CurrentCallback  = std::function<void(const std::optional<Reading>&)>;
  using SessionsCallback = std::function<void(const std::vector<SessionRecord>&)>;

  virtual ~IPostureStore() = default;

  virtual Status write_current(const std::string& owner, const Reading& r) = 0;
  virtual Status clear_current(const std::string& owner) = 0;
  virtual Status append_history(const std::string& owner, const Reading& r, std::string& id) = 0;
  /// Up to @p limit most recent readings, most recent last.
  virtual Status read_history(const std::string& owner, size_t limit, std::vector<Reading>& out) = 0;
  /// Fires with the current value right away, then on every change.
  virtual Subscription subscribe_current(const std::string& owner, CurrentCallback cb) = 0;

  /// Assigns `rec.id` when empty and stamps `rec.owner`.
  virtual Status save_session(const std::string& owner, SessionRecord& rec) = 0;
  /// Up to @p limit sessions, most recent start first.
  virtual Status list_sessions(const std::string& owner, size_t limit, std::vector<SessionRecord>& out) = 0;
  virtual Subscription subscribe_sessions(const std::string& owner, size_t limit, SessionsCallback cb) = 0;
  virtual Status delete_session(const std::string& owner, const std::string& id) = 0;
};

class JsonFileStore : public IPostureStore {
public:
  static constexpr size_t DEFAULT_HISTORY_CAP = 10000;

  explicit JsonFileStore(std::filesystem::path root, size_t history_cap = DEFAULT_HISTORY_CAP);

  Status write_current(const std::string& owner, const Reading& r) override;
  Status clear_current(const std::string& owner) override;
  Status append_history(const std::string& owner, const Reading& r, std::string& id) override;
  Status read_history(const std::string& owner, size_t limit, std::vector<Reading>& out) override;
  Subscription subscribe_current(const std::string& owner, CurrentCallback cb) override;

  Status save_session(const std::string& owner, SessionRecord& rec) override;
  Status list_sessions(const std::string& owner, size_t limit, std::vector<SessionRecord>& out) override;
  Subscription subscribe_sessions(const std::string& owner, size_t limit, SessionsCallback cb) override;
  Status delete_session(const std::string& owner, const std::string& id) override;

  const std::filesystem::path& root() const { return root_; }

private:
  struct Streams {
    EventStream<std::optional<Reading>>    current;
    EventStream<std::vector<SessionRecord>> sessions;
  };

  // Caller holds mtx_.
  Streams& streams_locked(const std::string& owner);
  std::optional<Reading> load_current_locked(const std::string& owner);
  Status load_sessions_locked(const std::string& owner, std::vector<SessionRecord>& out);
  std::string next_id_locked();

  std::filesystem::path dir(const std::string& owner) const { return root_ / owner; }
  void publish_sessions(const std::string& owner);

  std::filesystem::path root_;
  size_t history_cap_;

  std::mutex mtx_;
  uint32_t   id_seq_{0};
  std::map<std::string, std::unique_ptr<Streams>> streams_;
};

/// Owner ids become directory names: [A-Za-z0-9_.-], not "." or "..".
bool valid_owner(const std::string& owner);

} // namespace postura
