#include "intern/pool.hpp"
#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>
#include <string>

TEST(JsonFormatterTest, PoolStatsFields) {
  interner::PoolStats stats;
  stats.name = "symbols";
  stats.live_entries = 5;
  stats.shard_count = 4;
  stats.hits = 3;
  stats.misses = 1;
  stats.evictions = 2;
  stats.detached = 7;

  auto j = JsonFormatter::pool_stats_to_json(stats);
  EXPECT_EQ(j["pool"], "symbols");
  EXPECT_EQ(j["live_entries"], 5);
  EXPECT_EQ(j["shard_count"], 4);
  EXPECT_EQ(j["poisoned_shards"], 0);
  EXPECT_EQ(j["counters"]["hits"], 3);
  EXPECT_EQ(j["counters"]["misses"], 1);
  EXPECT_EQ(j["counters"]["evictions"], 2);
  EXPECT_EQ(j["counters"]["detached"], 7);
  EXPECT_DOUBLE_EQ(j["hit_ratio"].get<double>(), 0.75);
}

TEST(JsonFormatterTest, HitRatioWithoutLookups) {
  interner::PoolStats stats;
  stats.name = "empty";
  auto j = JsonFormatter::pool_stats_to_json(stats);
  EXPECT_DOUBLE_EQ(j["hit_ratio"].get<double>(), 0.0);
}

TEST(JsonFormatterTest, FormatsLivePoolStats) {
  interner::PoolOptions options;
  options.name = "json_live";
  interner::Pool<std::string> pool(options);
  auto a = pool.intern("x");
  auto b = pool.intern("x");

  const std::string compact = JsonFormatter::format_pool_stats(pool.stats());
  EXPECT_EQ(compact.find('\n'), std::string::npos);
  EXPECT_NE(compact.find("\"pool\":\"json_live\""), std::string::npos);

  const std::string pretty = JsonFormatter::format_pool_stats(pool.stats(), 2);
  EXPECT_NE(pretty.find('\n'), std::string::npos);

  auto parsed = nlohmann::json::parse(compact);
  EXPECT_EQ(parsed["live_entries"], 1);
  EXPECT_EQ(parsed["counters"]["hits"], 1);
}
