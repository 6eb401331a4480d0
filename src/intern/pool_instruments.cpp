#include "intern/pool_instruments.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

namespace interner {

PoolInstruments::PoolInstruments(const std::string &prefix,
                                 const std::string &pool_name)
    : registry_(MetricsRegistry::instance().get_registry()),
      hits_(MetricsRegistry::instance()
                .create_counter_family(prefix + "_pool_hits_total",
                                       "Interns answered by a live entry")
                .Add({{"pool", pool_name}})),
      misses_(MetricsRegistry::instance()
                  .create_counter_family(prefix + "_pool_misses_total",
                                         "Interns that created a new entry")
                  .Add({{"pool", pool_name}})),
      evictions_(MetricsRegistry::instance()
                     .create_counter_family(
                         prefix + "_pool_evictions_total",
                         "Entries removed after their last handle was dropped")
                     .Add({{"pool", pool_name}})),
      live_entries_(MetricsRegistry::instance()
                        .create_gauge_family(prefix + "_pool_live_entries",
                                             "Entries currently in the index")
                        .Add({{"pool", pool_name}})) {
  LOG(LogLevel::DEBUG, LogComponent::METRICS,
      "Registered metrics for pool '" << pool_name << "' under prefix '"
                                      << prefix << "'");
}

} // namespace interner
