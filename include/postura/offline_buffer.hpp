#pragma once
/**
 * @file offline_buffer.hpp
 * @brief Bounded FIFO of readings that could not reach the store.
 *
 * @details
 * Storage is a fixed-capacity `etl::deque`, so the buffer never allocates
 * after construction. When full, `enqueue()` evicts the oldest reading.
 *
 * If a file path is given, the queue is mirrored to it as a JSON array
 * (oldest first) after every change and reloaded by `load()`. A failed save
 * is logged; the in-memory queue stays authoritative.
 *
 * DRAINING
 * --------
 * Each stored reading carries a sequence number. `peek()` returns a batch
 * tagged with the sequence of its first item; `drop_first(batch, n)` then
 * removes only those of the first `n` items that are still present. Items
 * evicted while the batch was in flight are not counted twice and newer
 * items are never dropped by mistake.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "etl/deque.h"

#include "postura/reading.hpp"

namespace postura {

static constexpr size_t OFFLINE_MAX_CAPACITY     = 1024;
static constexpr size_t OFFLINE_DEFAULT_CAPACITY = 500;
static constexpr size_t OFFLINE_DEFAULT_PEEK     = 50;

struct OfflineBatch {
  uint64_t             first_seq{0};
  std::vector<Reading> items;
};

class OfflineBuffer {
public:
  /// @param capacity clamped to [1, OFFLINE_MAX_CAPACITY].
  /// @param file     mirror file; empty keeps the queue in memory only.
  explicit OfflineBuffer(size_t capacity = OFFLINE_DEFAULT_CAPACITY,
                         std::filesystem::path file = {});

  OfflineBuffer(const OfflineBuffer&) = delete;
  OfflineBuffer& operator=(const OfflineBuffer&) = delete;

  /// Replace the queue with the file contents (newest kept if over capacity).
  /// A missing file is an empty queue. False with a reason on a bad file.
  bool load(std::string& err);

  /// Append, evicting the oldest if full. Returns the new size.
  size_t enqueue(const Reading& r);

  /// Up to @p n oldest readings, oldest first.
  OfflineBatch peek(size_t n = OFFLINE_DEFAULT_PEEK) const;

  /// Remove the first @p n items of @p batch that are still queued. Returns the count removed.
  size_t drop_first(const OfflineBatch& batch, size_t n);

  /// Remove up to @p n oldest readings.
  size_t drop_first(size_t n);

  size_t size() const;
  size_t capacity() const { return capacity_; }
  bool   empty() const { return size() == 0; }

private:
  void save_locked() const;

  size_t                capacity_;
  std::filesystem::path file_;

  mutable std::mutex                         mtx_;
  etl::deque<Reading, OFFLINE_MAX_CAPACITY>  queue_;
  uint64_t                                   head_seq_{0};   // sequence of queue_.front()
};

} // namespace postura
