// ============================================================================
// offline_buffer.cpp: OfflineBuffer (see offline_buffer.hpp)
// ============================================================================

#include "postura/offline_buffer.hpp"
#include "postura/json_file.hpp"
#include "postura/log.hpp"

#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace postura {

OfflineBuffer::OfflineBuffer(size_t capacity, std::filesystem::path file)
: capacity_(std::min(std::max<size_t>(capacity, 1), OFFLINE_MAX_CAPACITY)),
  file_(std::move(file)) {}

bool OfflineBuffer::load(std::string& err) {
  err.clear();
  if (file_.empty()) return true;

  json arr;
  if (!read_json_file(file_, arr, err)) {
    if (!err.empty()) return false;
    arr = json::array();
  }
  if (!arr.is_array()) {
    err = "expected array in " + file_.string();
    return false;
  }

  std::lock_guard<std::mutex> lk(mtx_);
  queue_.clear();
  const size_t n = arr.size();
  const size_t first = (n > capacity_) ? n - capacity_ : 0;
  std::string why;
  for (size_t i = first; i < n; ++i) {
    Reading r;
    if (!decode_entry(arr[i], r, why)) {
      log::warn("offline_entry_skipped", {{"index", std::to_string(i)}, {"what", why}});
      continue;
    }
    queue_.push_back(r);
  }
  if (first > 0) {
    log::warn("offline_buffer_truncated", {{"dropped", std::to_string(first)}});
  }
  log::debug("offline_buffer_loaded", {{"size", std::to_string(queue_.size())}});
  return true;
}

size_t OfflineBuffer::enqueue(const Reading& r) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (queue_.size() >= capacity_) {
    queue_.pop_front();
    ++head_seq_;
  }
  queue_.push_back(r);
  save_locked();
  return queue_.size();
}

OfflineBatch OfflineBuffer::peek(size_t n) const {
  std::lock_guard<std::mutex> lk(mtx_);
  OfflineBatch batch;
  batch.first_seq = head_seq_;
  const size_t count = std::min(n, queue_.size());
  batch.items.reserve(count);
  for (size_t i = 0; i < count; ++i) batch.items.push_back(queue_[i]);
  return batch;
}

size_t OfflineBuffer::drop_first(const OfflineBatch& batch, size_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  const uint64_t end = batch.first_seq + std::min(n, batch.items.size());
  size_t removed = 0;
  while (!queue_.empty() && head_seq_ < end) {
    queue_.pop_front();
    ++head_seq_;
    ++removed;
  }
  if (removed) save_locked();
  return removed;
}

size_t OfflineBuffer::drop_first(size_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  size_t removed = 0;
  while (!queue_.empty() && removed < n) {
    queue_.pop_front();
    ++head_seq_;
    ++removed;
  }
  if (removed) save_locked();
  return removed;
}

size_t OfflineBuffer::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return queue_.size();
}

void OfflineBuffer::save_locked() const {
  if (file_.empty()) return;
  json arr = json::array();
  for (const auto& r : queue_) arr.push_back(r);
  std::string err;
  if (!atomic_write_json(file_, arr, err)) {
    log::warn("offline_buffer_save_failed", {{"what", err}});
  }
}

} // namespace postura
