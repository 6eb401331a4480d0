#include "intern/pool_options.hpp"

#include <stdexcept>
#include <vector>

namespace interner {

PoolOptions pool_options_from_config(const Config::AppConfig &config,
                                     const std::string &name) {
  PoolOptions options;
  options.name = name;
  options.shard_count = config.pool.shard_count;
  options.initial_capacity = config.pool.initial_capacity;
  options.metrics_enabled = config.metrics.enabled;
  options.metrics_prefix = config.metrics.prefix;
  return options;
}

void validate_pool_options(const PoolOptions &options) {
  Config::PoolConfig pool_config;
  pool_config.shard_count = options.shard_count;
  pool_config.initial_capacity = options.initial_capacity;

  std::vector<std::string> errors;
  if (options.name.empty())
    errors.push_back("Pool name must not be empty");
  Config::validate_pool_config(pool_config, errors);
  if (options.metrics_enabled) {
    Config::MetricsConfig metrics_config;
    metrics_config.enabled = true;
    metrics_config.prefix = options.metrics_prefix;
    Config::validate_metrics_config(metrics_config, errors);
  }

  if (errors.empty())
    return;

  std::string message = "Invalid options for pool '" + options.name + "':";
  for (const auto &error : errors)
    message += " " + error + ".";
  throw std::invalid_argument(message);
}

} // namespace interner
