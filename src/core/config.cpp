#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"pool.lifecycle", LogComponent::POOL_LIFECYCLE},
    {"pool.intern", LogComponent::POOL_INTERN},
    {"pool.evict", LogComponent::POOL_EVICT},
    {"metrics", LogComponent::METRICS}};

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

bool validate_pool_config(const PoolConfig &config,
                          std::vector<std::string> &errors) {
  bool valid = true;

  if (config.shard_count < 1 || config.shard_count > MAX_SHARD_COUNT) {
    errors.push_back("Pool shard count must be between 1 and " +
                     std::to_string(MAX_SHARD_COUNT));
    valid = false;
  } else if ((config.shard_count & (config.shard_count - 1)) != 0) {
    errors.push_back("Pool shard count must be a power of two");
    valid = false;
  }

  if (config.initial_capacity > 100000000) {
    errors.push_back("Pool initial capacity must not exceed 100000000");
    valid = false;
  }

  return valid;
}

bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.prefix.empty()) {
    errors.push_back("Metrics prefix must not be empty");
    valid = false;
  } else {
    // Prometheus metric names: [a-zA-Z_:][a-zA-Z0-9_:]*
    const unsigned char first = config.prefix.front();
    bool name_ok = std::isalpha(first) || first == '_' || first == ':';
    for (unsigned char c : config.prefix) {
      if (!(std::isalnum(c) || c == '_' || c == ':'))
        name_ok = false;
    }
    if (!name_ok) {
      errors.push_back("Metrics prefix '" + config.prefix +
                       "' is not a valid Prometheus metric name");
      valid = false;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_pool_config(config.pool, errors)) {
    valid = false;
  }

  if (!validate_metrics_config(config.metrics, errors)) {
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        config.custom_settings[key] = value;

        // Pool Settings
      } else if (current_section == "Pool") {
        if (key == Keys::POOL_SHARD_COUNT)
          config.pool.shard_count =
              Utils::string_to_number<std::size_t>(value).value_or(
                  config.pool.shard_count);
        else if (key == Keys::POOL_INITIAL_CAPACITY)
          config.pool.initial_capacity =
              Utils::string_to_number<std::size_t>(value).value_or(
                  config.pool.initial_capacity);

        // Metrics Settings
      } else if (current_section == "Metrics") {
        if (key == Keys::METRICS_ENABLED)
          config.metrics.enabled = string_to_bool(value);
        else if (key == Keys::METRICS_PREFIX)
          config.metrics.prefix = value;

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "pool.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          } else {
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
          }
        }
      } else {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown section '" << current_section << "'"
                  << std::endl;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  LOG(LogLevel::DEBUG, LogComponent::CONFIG,
      "Attempting to load configuration from " << filepath);

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated successfully from "
          << config_filepath_);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
