#include "connection_factory.hpp"

#include "duckdb.hpp"
#include "duckdb_connection.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

duckdb::DuckDB &
ConnectionFactory::get_duckdb(const std::string &database_path) {
  auto initialize_db = [this, &database_path]() {
    duckdb::DBConfig config;
    config.SetOptionByName("old_implicit_casting", true);

    stdout_logger.info("get_duckdb: creating database instance for <" +
                       database_path + ">");
    db = std::make_unique<duckdb::DuckDB>(database_path, &config);
    initial_database_path = database_path;
  };

  std::call_once(db_init_flag, initialize_db);

  if (database_path != initial_database_path) {
    throw std::runtime_error(
        "Trying to connect to a different warehouse database (" +
        database_path + ") than on the initial connection (" +
        initial_database_path + ")");
  }

  return *db;
}

DuckDBWarehouseConnection
ConnectionFactory::CreateConnection(const std::string &database_path) {
  stdout_logger.info("create_connection: start");
  duckdb::DuckDB &database = get_duckdb(database_path);
  duckdb::Connection con(database);

  // Set default_collation to a connection-specific default value which
  // overwrites any global setting, so business keys compare byte-wise.
  const auto set_collation_res = con.Query("SET default_collation=''");
  if (set_collation_res->HasError()) {
    throw std::runtime_error(
        "create_connection: Could not SET default_collation: " +
        set_collation_res->GetError());
  }

  return DuckDBWarehouseConnection(std::move(con));
}
