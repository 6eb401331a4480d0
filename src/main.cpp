#include "core/config.hpp"
#include "core/logger.hpp"
#include "intern/interner.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Small key set so threads keep colliding on the same entries
const std::array<std::string, 6> keys = {"GET",  "POST",   "PUT",
                                         "HEAD", "DELETE", "OPTIONS"};

int main(int argc, char *argv[]) {
  Config::ConfigManager config_manager;
  if (argc > 1 && std::string(argv[1]) != "-") {
    if (!config_manager.load_configuration(argv[1]))
      std::cerr << "Continuing with default configuration." << std::endl;
  }
  interner::apply_config(*config_manager.get_config());

  const std::size_t thread_count =
      argc > 2 ? Utils::string_to_number<std::size_t>(argv[2]).value_or(4) : 4;
  const std::size_t iterations =
      argc > 3 ? Utils::string_to_number<std::size_t>(argv[3]).value_or(100000)
               : 100000;

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Starting " << thread_count << " threads x " << iterations
                  << " iterations");

  std::atomic<std::size_t> mismatches{0};
  auto start = std::chrono::steady_clock::now();

  std::vector<std::thread> workers;
  workers.reserve(thread_count);
  for (std::size_t t = 0; t < thread_count; ++t) {
    workers.emplace_back([t, iterations, &mismatches]() {
      for (std::size_t i = 0; i < iterations; ++i) {
        const std::string &key = keys[(i + t) % keys.size()];
        auto first = interner::intern(key);
        auto second = interner::intern(key);
        auto copy = first;
        if (first != second || copy != first || *first != key)
          mismatches.fetch_add(1, std::memory_order_relaxed);
      }
    });
  }
  for (auto &worker : workers)
    worker.join();

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  auto stats = interner::global_pool<std::string>().stats();
  std::cout << JsonFormatter::format_pool_stats(stats, 2) << std::endl;
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Finished in " << elapsed.count() << " ms");

  if (mismatches.load() != 0) {
    std::cerr << "Error: " << mismatches.load()
              << " interns returned a non-canonical handle" << std::endl;
    return 1;
  }
  if (stats.live_entries != 0) {
    std::cerr << "Error: " << stats.live_entries
              << " entries still live after all handles were dropped"
              << std::endl;
    return 1;
  }
  return 0;
}
