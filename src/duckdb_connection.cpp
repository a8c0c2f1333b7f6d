#include "duckdb_connection.hpp"

#include "ds_error.hpp"
#include "duckdb.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
const DuckDBDialect DUCKDB_DIALECT{};
}

DuckDBWarehouseConnection::DuckDBWarehouseConnection(duckdb::DuckDB &db)
    : con(db) {}

DuckDBWarehouseConnection::DuckDBWarehouseConnection(duckdb::Connection &&con_)
    : con(std::move(con_)) {}

const SqlDialect &DuckDBWarehouseConnection::dialect() const {
  return DUCKDB_DIALECT;
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult>
DuckDBWarehouseConnection::run(const std::string &sql,
                               const std::vector<duckdb::Value> &params) {
  if (params.empty()) {
    auto result = con.Query(sql);
    if (result->HasError()) {
      throw ds_error::DatabaseError("Query failed <" + sql +
                                    ">: " + result->GetError());
    }
    return result;
  }

  auto statement = con.Prepare(sql);
  if (statement->HasError()) {
    throw ds_error::DatabaseError("Query failed <" + sql +
                                  "> (at bind step): " + statement->GetError());
  }
  duckdb::vector<duckdb::Value> values(params.begin(), params.end());
  auto result = statement->Execute(values, false);
  if (result->HasError()) {
    throw ds_error::DatabaseError("Query failed <" + sql +
                                  ">: " + result->GetError());
  }
  // We are allowed to do this cast because we disallow streaming results.
  return duckdb::unique_ptr_cast<duckdb::QueryResult,
                                 duckdb::MaterializedQueryResult>(
      std::move(result));
}

std::optional<std::int64_t>
DuckDBWarehouseConnection::execute(const std::string &sql,
                                   const std::vector<duckdb::Value> &params) {
  const auto result = run(sql, params);
  // INSERT, UPDATE and DELETE return a single "Count" column
  if (result->properties.return_type !=
          duckdb::StatementReturnType::CHANGED_ROWS ||
      result->RowCount() != 1 || result->ColumnCount() != 1) {
    return std::nullopt;
  }
  const auto count = result->GetValue(0, 0);
  if (count.IsNull()) {
    return std::nullopt;
  }
  return count.GetValue<int64_t>();
}

result_set
DuckDBWarehouseConnection::query(const std::string &sql,
                                 const std::vector<duckdb::Value> &params) {
  const auto result = run(sql, params);
  result_set rows;
  for (duckdb::idx_t row = 0; row < result->RowCount(); row++) {
    std::vector<duckdb::Value> values;
    values.reserve(result->ColumnCount());
    for (duckdb::idx_t col = 0; col < result->ColumnCount(); col++) {
      values.push_back(result->GetValue(col, row));
    }
    rows.rows.push_back(std::move(values));
  }
  return rows;
}

void DuckDBWarehouseConnection::begin_transaction() {
  run("BEGIN TRANSACTION", {});
}

void DuckDBWarehouseConnection::commit() { run("COMMIT", {}); }

void DuckDBWarehouseConnection::rollback() {
  // DuckDB already rolled back when a statement in the transaction failed
  if (!con.HasActiveTransaction()) {
    return;
  }
  run("ROLLBACK", {});
}
