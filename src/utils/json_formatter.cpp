#include "json_formatter.hpp"

nlohmann::json
JsonFormatter::pool_stats_to_json(const interner::PoolStats &stats) {
  nlohmann::json j;
  j["pool"] = stats.name;
  j["live_entries"] = stats.live_entries;
  j["shard_count"] = stats.shard_count;
  j["poisoned_shards"] = stats.poisoned_shards;

  nlohmann::json j_counters;
  j_counters["hits"] = stats.hits;
  j_counters["misses"] = stats.misses;
  j_counters["evictions"] = stats.evictions;
  j_counters["detached"] = stats.detached;
  j["counters"] = j_counters;

  const std::uint64_t lookups = stats.hits + stats.misses;
  j["hit_ratio"] =
      lookups > 0 ? static_cast<double>(stats.hits) / lookups : 0.0;
  return j;
}

std::string JsonFormatter::format_pool_stats(const interner::PoolStats &stats,
                                             int indent) {
  return pool_stats_to_json(stats).dump(indent);
}
