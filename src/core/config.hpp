#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Pool Settings
constexpr const char *POOL_SHARD_COUNT = "shard_count";
constexpr const char *POOL_INITIAL_CAPACITY = "initial_capacity";

// Metrics Settings
constexpr const char *METRICS_ENABLED = "enabled";
constexpr const char *METRICS_PREFIX = "prefix";

} // namespace Keys

constexpr std::size_t MAX_SHARD_COUNT = 1024;

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct PoolConfig {
  // Must be a power of two; 1 means a single lock over the whole index
  std::size_t shard_count = 1;
  std::size_t initial_capacity = 0;
};

struct MetricsConfig {
  bool enabled = false;
  std::string prefix = "interner";
};

struct AppConfig {
  LoggingConfig logging;
  PoolConfig pool;
  MetricsConfig metrics;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);
bool string_to_bool(const std::string &val_str_raw);

// Validation functions for configuration parameters
bool validate_pool_config(const PoolConfig &config,
                          std::vector<std::string> &errors);
bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
