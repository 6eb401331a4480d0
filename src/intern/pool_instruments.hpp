#ifndef POOL_INSTRUMENTS_HPP
#define POOL_INSTRUMENTS_HPP

#include <cstddef>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <string>

namespace interner {

// Prometheus series for one pool, labeled pool=<name>. Pools that share a
// name share their series.
class PoolInstruments {
public:
  PoolInstruments(const std::string &prefix, const std::string &pool_name);

  PoolInstruments(const PoolInstruments &) = delete;
  PoolInstruments &operator=(const PoolInstruments &) = delete;

  void record_hit() { hits_.Increment(); }
  void record_miss() {
    misses_.Increment();
    live_entries_.Increment();
  }
  void record_eviction() {
    evictions_.Increment();
    live_entries_.Decrement();
  }
  void record_detached(std::size_t count) {
    live_entries_.Decrement(static_cast<double>(count));
  }

private:
  // Keeps the families alive for handles dropped during static destruction
  std::shared_ptr<prometheus::Registry> registry_;
  prometheus::Counter &hits_;
  prometheus::Counter &misses_;
  prometheus::Counter &evictions_;
  prometheus::Gauge &live_entries_;
};

} // namespace interner

#endif // POOL_INSTRUMENTS_HPP
