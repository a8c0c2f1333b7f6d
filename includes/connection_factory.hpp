#pragma once

#include "ds_logging.hpp"
#include "duckdb.hpp"
#include "duckdb_connection.hpp"

#include <memory>
#include <mutex>
#include <string>

/// Creates connections to the DuckDB warehouse at the given path (or
/// ":memory:"). In practice, only one path is passed for the entire lifetime
/// of the process. If no duckdb::DuckDB has been instantiated yet, it will
/// create one on the first call to CreateConnection. Every load gets its own
/// connection.
class ConnectionFactory {
public:
	explicit ConnectionFactory() : stdout_logger(dslog::Logger::CreateStdoutLogger()) {
	}

	DuckDBWarehouseConnection CreateConnection(const std::string &database_path);

private:
	duckdb::DuckDB &get_duckdb(const std::string &database_path);

	// Only logs to stdout because there is no duckdb::Connection yet for
	// SQL-based logging
	dslog::Logger stdout_logger;
	std::once_flag db_init_flag;
	std::unique_ptr<duckdb::DuckDB> db;
	// Used to check that the same path is used on subsequent calls to
	// CreateConnection
	std::string initial_database_path;
};
