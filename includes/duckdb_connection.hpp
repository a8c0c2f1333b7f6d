#pragma once

#include "duckdb.hpp"
#include "sql_dialect.hpp"
#include "warehouse_connection.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// WarehouseConnection over an embedded or MotherDuck-attached DuckDB.
class DuckDBWarehouseConnection final : public WarehouseConnection {
public:
  explicit DuckDBWarehouseConnection(duckdb::DuckDB &db);
  explicit DuckDBWarehouseConnection(duckdb::Connection &&con_);

  [[nodiscard]] const SqlDialect &dialect() const override;

  std::optional<std::int64_t>
  execute(const std::string &sql,
          const std::vector<duckdb::Value> &params = {}) override;

  result_set query(const std::string &sql,
                   const std::vector<duckdb::Value> &params = {}) override;

  void begin_transaction() override;
  void commit() override;
  void rollback() override;

  /// The underlying connection, e.g. for the DuckDB log sink.
  duckdb::Connection &native() { return con; }

private:
  duckdb::unique_ptr<duckdb::MaterializedQueryResult>
  run(const std::string &sql, const std::vector<duckdb::Value> &params);

  duckdb::Connection con;
};
