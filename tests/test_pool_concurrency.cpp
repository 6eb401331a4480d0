#include "intern/pool.hpp"

#include <atomic>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

using interner::Handle;
using interner::Pool;
using interner::PoolOptions;

namespace {

struct TestStruct {
  std::string name;
  std::uint64_t number;

  bool operator==(const TestStruct &other) const {
    return std::tie(name, number) == std::tie(other.name, other.number);
  }
};

// Spins until every participant has arrived
class StartLine {
public:
  explicit StartLine(std::size_t participants) : waiting_(participants) {}

  void arrive_and_wait() {
    waiting_.fetch_sub(1, std::memory_order_acq_rel);
    while (waiting_.load(std::memory_order_acquire) > 0)
      std::this_thread::yield();
  }

private:
  std::atomic<std::size_t> waiting_;
};

} // namespace

namespace std {
template <> struct hash<TestStruct> {
  size_t operator()(const TestStruct &s) const noexcept {
    return std::hash<std::string>{}(s.name) ^ (s.number * 0x9e3779b97f4a7c15ULL);
  }
};
} // namespace std

// Run every scenario against the single-lock and the sharded layout
class PoolConcurrencyTest : public ::testing::TestWithParam<std::size_t> {
protected:
  PoolOptions make_options(const std::string &name) const {
    PoolOptions options;
    options.name = name + "_" + std::to_string(GetParam());
    options.shard_count = GetParam();
    return options;
  }
};

TEST_P(PoolConcurrencyTest, FirstInternFromManyThreadsIsCanonical) {
  constexpr std::size_t kThreads = 8;
  constexpr int kRounds = 200;

  for (int round = 0; round < kRounds; ++round) {
    Pool<std::string> pool(make_options("first_intern"));
    StartLine start(kThreads);
    std::vector<Handle<std::string>> handles(kThreads);
    std::vector<std::thread> threads;

    for (std::size_t t = 0; t < kThreads; ++t) {
      threads.emplace_back([&, t]() {
        start.arrive_and_wait();
        handles[t] = pool.intern("shared-" + std::to_string(round));
      });
    }
    for (auto &thread : threads)
      thread.join();

    ASSERT_EQ(pool.size(), 1u);
    for (std::size_t t = 1; t < kThreads; ++t)
      ASSERT_EQ(handles[0], handles[t]);
    ASSERT_EQ(handles[0].refcount(), kThreads);

    auto stats = pool.stats();
    ASSERT_EQ(stats.misses, 1u);
    ASSERT_EQ(stats.hits, kThreads - 1);
  }
}

TEST_P(PoolConcurrencyTest, CreateAndDestroyFromManyThreads) {
  Pool<TestStruct> pool(make_options("churn"));
  std::vector<std::thread> threads;

  for (int t = 0; t < 3; ++t) {
    threads.emplace_back([&pool]() {
      for (int i = 0; i < 20000; ++i) {
        auto interned1 = pool.intern(TestStruct{"foo", 5});
        auto interned2 = pool.intern(TestStruct{"bar", 10});
      }
    });
  }
  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(pool.size(), 0u);
  auto stats = pool.stats();
  EXPECT_EQ(stats.misses, stats.evictions);
  EXPECT_EQ(stats.hits + stats.misses, 3u * 20000u * 2u);
}

TEST_P(PoolConcurrencyTest, LastDropRacingInternNeverLosesEntry) {
  constexpr int kRounds = 2000;
  Pool<std::string> pool(make_options("drop_race"));

  for (int round = 0; round < kRounds; ++round) {
    auto victim = pool.intern("contended");
    StartLine start(2);
    Handle<std::string> fresh;

    std::thread dropper([&]() {
      start.arrive_and_wait();
      victim.reset();
    });
    std::thread interner_thread([&]() {
      start.arrive_and_wait();
      fresh = pool.intern("contended");
    });
    dropper.join();
    interner_thread.join();

    // Whichever side won, the surviving handle's entry is the only one
    ASSERT_EQ(pool.size(), 1u);
    ASSERT_TRUE(pool.contains("contended"));
    ASSERT_EQ(fresh.refcount(), 1u);
    ASSERT_EQ(pool.intern("contended"), fresh);

    fresh.reset();
    ASSERT_EQ(pool.size(), 0u);
  }
}

TEST_P(PoolConcurrencyTest, CopiesAcrossThreadsKeepEntryAlive) {
  Pool<std::string> pool(make_options("copies"));
  auto root = pool.intern("root");
  std::vector<std::thread> threads;
  std::atomic<int> mismatches{0};

  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 10000; ++i) {
        Handle<std::string> copy = root;
        Handle<std::string> second = copy;
        if (second != root || *copy != "root")
          mismatches.fetch_add(1);
      }
    });
  }
  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(mismatches.load(), 0);
  EXPECT_EQ(root.refcount(), 1u);
  EXPECT_EQ(pool.size(), 1u);
}

TEST_P(PoolConcurrencyTest, ManyKeysManyThreads) {
  constexpr int kThreads = 6;
  constexpr int kKeys = 64;
  Pool<int> pool(make_options("many_keys"));
  std::vector<Handle<int>> anchors;
  for (int k = 0; k < kKeys; k += 2)
    anchors.push_back(pool.intern(k));

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 5000; ++i) {
        const int key = (i * 7 + t) % kKeys;
        auto h = pool.intern(key);
        if (*h != key)
          mismatches.fetch_add(1);
        // Even keys are pinned, so they must resolve to the anchor
        if (key % 2 == 0 && h != anchors[key / 2])
          mismatches.fetch_add(1);
      }
    });
  }
  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(mismatches.load(), 0);
  EXPECT_EQ(pool.size(), static_cast<std::size_t>(kKeys / 2));
  for (const auto &anchor : anchors)
    EXPECT_EQ(anchor.refcount(), 1u);
}

TEST_P(PoolConcurrencyTest, ClearWhileHandlesAreDropped) {
  Pool<int> pool(make_options("clear_race"));
  std::atomic<bool> stop{false};
  std::vector<std::thread> threads;

  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      int i = 0;
      while (!stop.load(std::memory_order_relaxed)) {
        auto a = pool.intern(i % 16);
        auto b = a;
        auto c = pool.intern((i + t) % 16);
        ++i;
      }
    });
  }
  for (int i = 0; i < 200; ++i) {
    pool.clear();
    std::this_thread::yield();
  }
  stop = true;
  for (auto &thread : threads)
    thread.join();

  EXPECT_EQ(pool.size(), 0u);
  EXPECT_EQ(pool.stats().poisoned_shards, 0u);
}

INSTANTIATE_TEST_SUITE_P(ShardLayouts, PoolConcurrencyTest,
                         ::testing::Values(std::size_t{1}, std::size_t{8}));
