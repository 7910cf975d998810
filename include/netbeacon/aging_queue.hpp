/**
 * @file aging_queue.hpp
 * @brief Insertion-ordered map keyed by beacon UUID, with time-based eviction.
 *
 * @details
 * The engine keeps three of these: beacons it sent, beacons it received (a list per
 * UUID, one entry per interface/VLAN it arrived on) and the topology hints inferred
 * per UUID. Entries never get deleted one by one. They leave the queue only when their
 * UUID's embedded creation time falls outside the window, or when the whole queue is
 * cleared on shutdown.
 *
 * @par Ordering
 * Entries sit in a plain sequence in insertion order. age_out() erases in place with
 * a stable remove, so survivors keep their relative order. Updating an existing key
 * keeps its position.
 *
 * @par Window
 * An entry is purged when `|now - created| > window`. Beacons stamped far in the
 * future (a peer with a skewed clock) are purged like stale ones.
 *
 * @par Complexity
 * Lookups are linear scans. Queues hold one discovery round's worth of beacons.
 */
#ifndef NETBEACON_AGING_QUEUE_HPP
#define NETBEACON_AGING_QUEUE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <utility>

#include "netbeacon/uuid.hpp"

namespace netbeacon {

/// Default aging window, in milliseconds.
static constexpr uint64_t DEFAULT_AGING_WINDOW_MS = 120000;

template <typename V>
class AgingQueue {
public:
  struct Entry {
    std::string uuid;
    int64_t     created_ms;   ///< recovered from the UUID
    V           value;
  };

  using const_iterator = typename std::deque<Entry>::const_iterator;

  explicit AgingQueue(uint64_t window_ms = DEFAULT_AGING_WINDOW_MS)
  : window_ms_(window_ms) {}

  uint64_t window_ms() const { return window_ms_; }
  void set_window_ms(uint64_t w) { window_ms_ = w; }

  /// True if a UUID created at `created_ms` is still live at `now_ms`.
  bool is_live(int64_t created_ms, int64_t now_ms) const {
    const int64_t age = now_ms - created_ms;
    const int64_t w   = static_cast<int64_t>(window_ms_);
    return age <= w && age >= -w;
  }

  /**
   * @brief Drop every entry outside the window.
   * @return Number of entries removed.
   */
  size_t age_out(int64_t now_ms) {
    const size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e) { return !is_live(e.created_ms, now_ms); }),
                   entries_.end());
    return before - entries_.size();
  }

  /**
   * @brief Insert or update the value stored under `uuid`.
   *
   * Ages the queue first. A UUID whose creation time cannot be recovered, or that is
   * already outside the window, is not stored.
   *
   * @retval true  Stored (new entry appended, or existing entry updated in place).
   * @retval false Rejected.
   */
  bool remember(const std::string& uuid, V value, int64_t now_ms) {
    age_out(now_ms);
    int64_t created = 0;
    if (!uuid_to_timestamp(uuid, created)) return false;
    if (!is_live(created, now_ms)) return false;
    if (V* existing = find(uuid)) {
      *existing = std::move(value);
      return true;
    }
    entries_.push_back(Entry{uuid, created, std::move(value)});
    return true;
  }

  V* find(const std::string& uuid) {
    for (auto& e : entries_) {
      if (e.uuid == uuid) return &e.value;
    }
    return nullptr;
  }

  const V* find(const std::string& uuid) const {
    for (const auto& e : entries_) {
      if (e.uuid == uuid) return &e.value;
    }
    return nullptr;
  }

  bool contains(const std::string& uuid) const { return find(uuid) != nullptr; }

  size_t size() const  { return entries_.size(); }
  bool   empty() const { return entries_.empty(); }
  void   clear()       { entries_.clear(); }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const   { return entries_.end(); }

private:
  uint64_t          window_ms_;
  std::deque<Entry> entries_;
};

} // namespace netbeacon

#endif // NETBEACON_AGING_QUEUE_HPP
