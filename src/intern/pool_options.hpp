#ifndef POOL_OPTIONS_HPP
#define POOL_OPTIONS_HPP

#include "core/config.hpp"

#include <cstddef>
#include <string>

namespace interner {

struct PoolOptions {
  std::string name = "default";
  // Power of two in [1, Config::MAX_SHARD_COUNT]
  std::size_t shard_count = 1;
  // Buckets reserved up front in every shard
  std::size_t initial_capacity = 0;
  bool metrics_enabled = false;
  std::string metrics_prefix = "interner";
};

PoolOptions pool_options_from_config(const Config::AppConfig &config,
                                     const std::string &name);

// Throws std::invalid_argument listing every problem found
void validate_pool_options(const PoolOptions &options);

} // namespace interner

#endif // POOL_OPTIONS_HPP
