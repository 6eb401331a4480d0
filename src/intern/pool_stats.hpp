#ifndef POOL_STATS_HPP
#define POOL_STATS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace interner {

/**
 * @brief Point-in-time counters for one pool
 *
 * Shards are sampled one after another, so live_entries is advisory while
 * other threads are interning or dropping handles.
 */
struct PoolStats {
  std::string name;
  std::size_t live_entries = 0;
  std::size_t shard_count = 0;
  std::uint64_t hits = 0;      // interns answered by an existing entry
  std::uint64_t misses = 0;    // interns that allocated a new entry
  std::uint64_t evictions = 0; // entries removed when their last handle died
  std::uint64_t detached = 0;  // entries handed over to their handles by clear()
  std::size_t poisoned_shards = 0;
};

} // namespace interner

#endif // POOL_STATS_HPP
