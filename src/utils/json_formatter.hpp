#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "intern/pool_stats.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json pool_stats_to_json(const interner::PoolStats &stats);

// indent < 0 produces a single line
std::string format_pool_stats(const interner::PoolStats &stats,
                              int indent = -1);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
