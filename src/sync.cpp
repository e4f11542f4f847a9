// ============================================================================
// sync.cpp: SyncOrchestrator (see sync.hpp)
// ============================================================================

#include "postura/sync.hpp"
#include "postura/log.hpp"

#include <algorithm>
#include <utility>

namespace postura {

SyncOrchestrator::SyncOrchestrator(IPostureStore& store, OfflineBuffer& buffer, IScheduler& sched,
                                   INotifier& notifier, SyncOptions opt)
: store_(store), buffer_(buffer), sched_(sched), notifier_(notifier), opt_(std::move(opt)) {
  if (opt_.drain_batch == 0) opt_.drain_batch = 1;
}

Status SyncOrchestrator::persist(const Reading& r) {
  const Status st = store_.write_current(opt_.owner, r);
  if (!ok(st)) {
    const size_t n = buffer_.enqueue(r);
    log::warn("reading_buffered", {{"reason", to_string(st)}, {"buffered", std::to_string(n)}});

    bool emit = false;
    {
      std::lock_guard<std::mutex> lk(notice_mtx_);
      const uint64_t now = sched_.now_ms();
      if (!noticed_ || now - last_notice_ms_ >= opt_.notice_interval_ms) {
        noticed_ = true;
        last_notice_ms_ = now;
        emit = true;
      }
    }
    if (emit) notifier_.notice("Store unreachable: buffering readings locally");
    return Status::RemoteWriteFailed;
  }

  drain();
  return Status::Ok;
}

size_t SyncOrchestrator::drain() {
  std::lock_guard<std::mutex> lk(drain_mtx_);
  const OfflineBatch batch = buffer_.peek(opt_.drain_batch);
  if (batch.items.empty()) return 0;

  size_t stored = 0;
  for (const auto& r : batch.items) {
    std::string id;
    const Status st = store_.append_history(opt_.owner, r, id);
    if (!ok(st)) {
      log::warn("drain_stopped", {{"reason", to_string(st)}, {"stored", std::to_string(stored)}});
      break;
    }
    ++stored;
  }
  const size_t removed = buffer_.drop_first(batch, stored);
  if (stored) {
    log::info("buffer_drained", {{"stored", std::to_string(stored)},
                                 {"removed", std::to_string(removed)},
                                 {"left", std::to_string(buffer_.size())}});
  }
  return stored;
}

Status SyncOrchestrator::persist_session(SessionRecord& rec) {
  const Status st = store_.save_session(opt_.owner, rec);
  if (ok(st)) log::debug("session_stored", {{"id", rec.id}, {"owner", opt_.owner}});
  return st;
}

Status SyncOrchestrator::history(size_t limit, std::vector<Reading>& out) {
  return store_.read_history(opt_.owner, limit, out);
}

Status SyncOrchestrator::sessions(size_t limit, std::vector<SessionRecord>& out) {
  return store_.list_sessions(opt_.owner, limit, out);
}

Status SyncOrchestrator::delete_session(const std::string& id) {
  return store_.delete_session(opt_.owner, id);
}

Status SyncOrchestrator::statistics(SessionStats& out, size_t limit) {
  std::vector<SessionRecord> all;
  const Status st = store_.list_sessions(opt_.owner, limit, all);
  if (!ok(st)) return st;
  out = summarize(all);
  return Status::Ok;
}

} // namespace postura
