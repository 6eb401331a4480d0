#include "intern/global_pool.hpp"
#include "core/logger.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#include <mutex>

namespace interner {

namespace {

std::mutex &defaults_mutex() {
  static std::mutex mutex;
  return mutex;
}

PoolOptions &defaults() {
  static PoolOptions options;
  return options;
}

} // namespace

PoolOptions default_pool_options() {
  std::lock_guard<std::mutex> lock(defaults_mutex());
  return defaults();
}

void set_default_pool_options(PoolOptions options) {
  validate_pool_options(options);
  std::lock_guard<std::mutex> lock(defaults_mutex());
  defaults() = std::move(options);
}

void apply_config(const Config::AppConfig &config) {
  LogManager::instance().configure(config.logging);
  set_default_pool_options(pool_options_from_config(config, "default"));
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Interner configured: shard_count=" << config.pool.shard_count
          << ", initial_capacity=" << config.pool.initial_capacity
          << ", metrics=" << (config.metrics.enabled ? "on" : "off"));
}

std::string global_pool_name(const std::type_info &type) {
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(
      abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled)
    return std::string("global:") + demangled.get();
  return std::string("global:") + type.name();
}

} // namespace interner
