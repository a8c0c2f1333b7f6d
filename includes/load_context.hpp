#pragma once

#include "connection_factory.hpp"
#include "dimension_loader.hpp"
#include "ds_logging.hpp"
#include "duckdb_connection.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

class LoadConfiguration {
public:
    static LoadConfiguration FromMap(
        const std::unordered_map<std::string, std::string> &load_config);

    std::string warehouse_database;
    std::int64_t default_start_id;
    std::size_t insert_batch_size;

private:
    LoadConfiguration() = default;
};

/// Context for a single load into the warehouse. Contains the connection and
/// logger for the load.
class LoadContext {
public:
  explicit LoadContext(
      const std::string &load_name_, ConnectionFactory &connection_factory,
      const std::unordered_map<std::string, std::string> &load_config);
  ~LoadContext();

  LoadContext(const LoadContext &) = delete;
  LoadContext &operator=(const LoadContext &) = delete;

  const LoadConfiguration &GetConfiguration() const { return configuration; }
  /// Get the warehouse connection for the current load
  DuckDBWarehouseConnection &GetConnection() { return con; }
  /// Get the logger for the current load
  dslog::Logger &GetLogger() { return logger; }
  /// A loader that logs to this context and uses its batch size
  DimensionLoader CreateLoader();

private:
  std::string load_name;
  LoadConfiguration configuration;
  DuckDBWarehouseConnection con;
  // Logger has to have a shorter lifetime than the connection
  dslog::Logger logger;
};
