#ifndef POOL_HPP
#define POOL_HPP

#include "core/logger.hpp"
#include "intern/entry.hpp"
#include "intern/handle.hpp"
#include "intern/pool_error.hpp"
#include "intern/pool_instruments.hpp"
#include "intern/pool_options.hpp"
#include "intern/pool_stats.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace interner {
namespace detail {

/**
 * @brief Sharded value -> entry index behind a Pool
 *
 * Every key lives in the shard picked by its hash, and every check-then-act
 * sequence on a key (lookup-or-insert, final-decrement-and-remove) runs
 * under that shard's mutex. A refcount can only drop to zero inside
 * release_last while the lock is held, and intern only increments while
 * holding the same lock, so an intern either revives an entry before its
 * last decrement or misses it after it is gone.
 *
 * Entries keep the state alive through a shared_ptr, so handles may outlive
 * the Pool object that created them.
 */
template <typename T>
class PoolState : public std::enable_shared_from_this<PoolState<T>> {
public:
  explicit PoolState(PoolOptions options)
      : options_(std::move(options)), shard_mask_(options_.shard_count - 1),
        shards_(options_.shard_count) {
    if (options_.initial_capacity > 0) {
      for (auto &shard : shards_)
        shard.index.reserve(options_.initial_capacity);
    }
    if (options_.metrics_enabled) {
      instruments_ = std::make_unique<PoolInstruments>(
          options_.metrics_prefix, options_.name);
    }
  }

  PoolState(const PoolState &) = delete;
  PoolState &operator=(const PoolState &) = delete;

  Handle<T> intern(T value) {
    // Hashing happens before taking the lock; the entry caches it
    const std::size_t hash = std::hash<T>{}(value);
    const std::size_t shard_index = hash & shard_mask_;
    Shard &shard = shards_[shard_index];

    std::lock_guard<std::mutex> lock(shard.mutex);
    if (shard.poisoned) {
      LOG(LogLevel::ERROR, LogComponent::POOL_INTERN,
          "Rejected intern into poisoned shard " << shard_index << " of pool '"
                                                 << options_.name << "'");
      throw PoolPoisonedError(options_.name, shard_index);
    }

    auto it = shard.index.find(Key<T>{&value, hash});
    if (it != shard.index.end()) {
      Entry<T> *entry = it->second.get();
      entry->refcount.fetch_add(1, std::memory_order_relaxed);
      hits_.fetch_add(1, std::memory_order_relaxed);
      if (instruments_)
        instruments_->record_hit();
      LOG(LogLevel::TRACE, LogComponent::POOL_INTERN,
          "Hit in pool '" << options_.name << "' shard " << shard_index
                          << " (hash " << hash << ")");
      return Handle<T>(entry);
    }

    auto entry = std::make_unique<Entry<T>>(std::move(value), hash,
                                            this->shared_from_this());
    Entry<T> *raw = entry.get();
    shard.index.emplace(Key<T>{&raw->value, hash}, std::move(entry));
    misses_.fetch_add(1, std::memory_order_relaxed);
    if (instruments_)
      instruments_->record_miss();
    LOG(LogLevel::TRACE, LogComponent::POOL_INTERN,
        "Miss in pool '" << options_.name << "' shard " << shard_index
                         << " (hash " << hash << "), new entry created");
    return Handle<T>(raw);
  }

  // Called by a handle that may be the last reference to entry
  void release_last(Entry<T> *entry) {
    const std::size_t shard_index = entry->hash & shard_mask_;
    Shard &shard = shards_[shard_index];

    // Destroyed after the lock is released
    std::unique_ptr<Entry<T>> doomed;
    {
      std::lock_guard<std::mutex> lock(shard.mutex);
      // Detached entries are outside the index and can still be freed
      if (shard.poisoned && !entry->detached)
        throw PoolPoisonedError(options_.name, shard_index);

      if (entry->refcount.fetch_sub(1, std::memory_order_acq_rel) != 1)
        return; // revived by an intern or a copy before we got the lock

      if (entry->detached) {
        doomed.reset(entry);
      } else {
        try {
          auto it = shard.index.find(Key<T>{&entry->value, entry->hash});
          if (it == shard.index.end() || it->second.get() != entry)
            throw PoolPoisonedError(options_.name, shard_index);
          doomed = std::move(it->second);
          shard.index.erase(it);
        } catch (...) {
          shard.poisoned = true;
          LOG(LogLevel::FATAL, LogComponent::POOL_EVICT,
              "Shard " << shard_index << " of pool '" << options_.name
                       << "' poisoned while evicting an entry");
          throw;
        }
        evictions_.fetch_add(1, std::memory_order_relaxed);
        if (instruments_)
          instruments_->record_eviction();
        LOG(LogLevel::DEBUG, LogComponent::POOL_EVICT,
            "Evicted entry (hash " << entry->hash << ") from pool '"
                                   << options_.name << "' shard "
                                   << shard_index);
      }
    }
  }

  bool contains(const T &value) const {
    const std::size_t hash = std::hash<T>{}(value);
    const std::size_t shard_index = hash & shard_mask_;
    const Shard &shard = shards_[shard_index];
    std::lock_guard<std::mutex> lock(shard.mutex);
    // The index may hold an entry that is already dead
    if (shard.poisoned)
      throw PoolPoisonedError(options_.name, shard_index);
    return shard.index.find(Key<T>{&value, hash}) != shard.index.end();
  }

  std::size_t size() const {
    std::size_t total = 0;
    for (const auto &shard : shards_) {
      std::lock_guard<std::mutex> lock(shard.mutex);
      total += live_count(shard);
    }
    return total;
  }

  PoolStats stats() const {
    PoolStats stats;
    stats.name = options_.name;
    stats.shard_count = shards_.size();
    for (const auto &shard : shards_) {
      std::lock_guard<std::mutex> lock(shard.mutex);
      stats.live_entries += live_count(shard);
      if (shard.poisoned)
        ++stats.poisoned_shards;
    }
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    stats.detached = detached_.load(std::memory_order_relaxed);
    return stats;
  }

  // Empties the index. Entries that still have handles are handed over to
  // them and freed by the last one. Returns how many were handed over.
  std::size_t detach_all() {
    std::size_t handed_over = 0;
    for (auto &shard : shards_) {
      std::vector<std::unique_ptr<Entry<T>>> orphans;
      {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto &item : shard.index) {
          // Zero only happens in a poisoned shard; nobody can free those
          if (item.second->refcount.load(std::memory_order_acquire) == 0) {
            orphans.push_back(std::move(item.second));
            continue;
          }
          item.second->detached = true;
          item.second.release();
          ++handed_over;
        }
        shard.index.clear();
      }
    }
    detached_.fetch_add(handed_over, std::memory_order_relaxed);
    if (instruments_ && handed_over > 0)
      instruments_->record_detached(handed_over);
    return handed_over;
  }

  const PoolOptions &options() const { return options_; }

private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<Key<T>, std::unique_ptr<Entry<T>>, KeyHash<T>,
                       KeyEqual<T>>
        index;
    bool poisoned = false;
  };

  // Caller holds shard.mutex. Dead entries can only linger in a poisoned
  // shard, so healthy shards skip the scan.
  static std::size_t live_count(const Shard &shard) {
    if (!shard.poisoned)
      return shard.index.size();
    std::size_t live = 0;
    for (const auto &item : shard.index) {
      if (item.second->refcount.load(std::memory_order_acquire) > 0)
        ++live;
    }
    return live;
  }

  const PoolOptions options_;
  const std::size_t shard_mask_;
  std::vector<Shard> shards_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> detached_{0};

  std::unique_ptr<PoolInstruments> instruments_;
};

} // namespace detail

template <typename T> void Handle<T>::reset() {
  detail::Entry<T> *entry = std::exchange(entry_, nullptr);
  if (entry == nullptr)
    return;

  // Decrements that leave the entry alive need no lock
  std::size_t count = entry->refcount.load(std::memory_order_relaxed);
  while (count > 1) {
    if (entry->refcount.compare_exchange_weak(count, count - 1,
                                              std::memory_order_release,
                                              std::memory_order_relaxed))
      return;
  }

  // Possibly the last reference. The copy keeps the state alive even if
  // release_last frees the entry that holds the other one.
  std::shared_ptr<detail::PoolState<T>> owner = entry->owner;
  owner->release_last(entry);
}

/**
 * @brief Thread-safe interning pool for values of type T
 *
 * Stores exactly one canonical copy of each distinct live value and hands out
 * reference-counted Handles to it. The entry is evicted as soon as its last
 * Handle goes away. T needs operator== and a std::hash specialization, and
 * must be safe to read from several threads at once.
 *
 * A Pool may be destroyed while Handles are still alive: its entries are
 * detached exactly as clear() does.
 */
template <typename T> class Pool {
public:
  explicit Pool(PoolOptions options = PoolOptions{}) {
    validate_pool_options(options);
    state_ = std::make_shared<detail::PoolState<T>>(std::move(options));
    LOG(LogLevel::DEBUG, LogComponent::POOL_LIFECYCLE,
        "Created pool '" << state_->options().name << "' with "
                         << state_->options().shard_count << " shard(s)");
  }

  ~Pool() {
    const std::size_t handed_over = state_->detach_all();
    LOG(LogLevel::DEBUG, LogComponent::POOL_LIFECYCLE,
        "Destroyed pool '" << state_->options().name << "', " << handed_over
                           << " entries left to their handles");
  }

  // Disable copy and move operations; handles point into this pool
  Pool(const Pool &) = delete;
  Pool &operator=(const Pool &) = delete;
  Pool(Pool &&) = delete;
  Pool &operator=(Pool &&) = delete;

  /**
   * @brief Return a handle to the canonical copy of value
   *
   * Reuses the live entry for an equal value when there is one, otherwise
   * stores value as the new canonical copy.
   * @throws PoolPoisonedError if the value's shard is poisoned
   */
  Handle<T> intern(T value) { return state_->intern(std::move(value)); }

  // @throws PoolPoisonedError if the value's shard is poisoned
  bool contains(const T &value) const { return state_->contains(value); }

  std::size_t size() const { return state_->size(); }
  bool empty() const { return size() == 0; }

  PoolStats stats() const { return state_->stats(); }

  /**
   * @brief Forget every entry (for testing/reset)
   *
   * Outstanding handles stay valid and keep comparing equal to each other,
   * but later interns of equal values create new entries.
   * @return Number of entries that were still referenced
   */
  std::size_t clear() {
    const std::size_t handed_over = state_->detach_all();
    LOG(LogLevel::INFO, LogComponent::POOL_LIFECYCLE,
        "Cleared pool '" << state_->options().name << "', " << handed_over
                         << " entries left to their handles");
    return handed_over;
  }

  const std::string &name() const { return state_->options().name; }

private:
  std::shared_ptr<detail::PoolState<T>> state_;
};

} // namespace interner

#endif // POOL_HPP
