#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace config {
inline constexpr const char *PROP_DATABASE = "warehouse_database";
inline constexpr const char *PROP_DEFAULT_START_ID = "default_start_id";
inline constexpr const char *PROP_INSERT_BATCH_SIZE = "insert_batch_size";

inline constexpr const char *ENV_DISABLE_DUCKDB_LOGGING =
    "DIMSYNC_DISABLE_DUCKDB_LOGGING";

// Rows per multi-row INSERT of the delta inserter. The effective batch is
// further limited by the bound-parameter limit of the dialect.
inline constexpr std::size_t DEFAULT_INSERT_BATCH_SIZE = 500;
inline constexpr std::size_t MAX_INSERT_BATCH_SIZE = 100000;

inline constexpr std::int64_t DEFAULT_START_ID = 0;

template <typename MapLike>
std::string find_property(const MapLike &config,
                          const std::string &property_name) {
  const auto token_it = config.find(property_name);
  if (token_it == config.end()) {
    throw std::invalid_argument("Missing property " + property_name);
  }
  return token_it->second;
}

template <typename MapLike>
std::optional<std::string> find_optional_property(const MapLike &config,
                                   const std::string &property_name) {
    const auto token_it = config.find(property_name);
    if (token_it == config.end()) {
        return std::nullopt;
    }
    return token_it->second;
}
} // namespace config
