#pragma once
/**
 * @file sync.hpp
 * @brief Routes readings and sessions to the store, buffering readings while it is unreachable.
 *
 * @details
 * persist(reading):
 *   1. write_current(owner, reading)
 *   2. failed -> enqueue into the offline buffer, notice at most once per
 *      notice interval, done
 *   3. ok     -> drain up to one batch of buffered readings into history,
 *      oldest first; stop at the first failure and drop only what the store
 *      confirmed
 *
 * The orchestrator is also the session engine's record sink.
 */

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "postura/offline_buffer.hpp"
#include "postura/reading.hpp"
#include "postura/scheduler.hpp"
#include "postura/session.hpp"
#include "postura/status.hpp"
#include "postura/store.hpp"

namespace postura {

struct SyncOptions {
  std::string owner;
  size_t      drain_batch{20};
  uint64_t    notice_interval_ms{10000};
};

class SyncOrchestrator : public IRecordSink {
public:
  SyncOrchestrator(IPostureStore& store, OfflineBuffer& buffer, IScheduler& sched,
                   INotifier& notifier, SyncOptions opt);

  /// Ok if the store took it, RemoteWriteFailed if it went to the buffer.
  Status persist(const Reading& r);

  /// Push buffered readings to history without a new reading. Returns how many were stored.
  size_t drain();

  Status persist_session(SessionRecord& rec) override;

  Status history(size_t limit, std::vector<Reading>& out);
  Status sessions(size_t limit, std::vector<SessionRecord>& out);
  Status delete_session(const std::string& id);
  Status statistics(SessionStats& out, size_t limit = 1000);

  size_t buffered() const { return buffer_.size(); }
  const std::string& owner() const { return opt_.owner; }

private:
  IPostureStore& store_;
  OfflineBuffer& buffer_;
  IScheduler&    sched_;
  INotifier&     notifier_;
  SyncOptions    opt_;

  std::mutex drain_mtx_;        // one drain at a time
  std::mutex notice_mtx_;
  bool       noticed_{false};
  uint64_t   last_notice_ms_{0};
};

} // namespace postura
