#include "schema_introspector.hpp"

#include "duckdb.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

bool SchemaIntrospector::table_exists(const table_def &table) {
  const auto &dialect = con.dialect();
  const std::string query =
      "SELECT TABLE_NAME FROM INFORMATION_SCHEMA.TABLES WHERE TABLE_CATALOG = " +
      dialect.current_catalog_expression() +
      " AND TABLE_SCHEMA = ? AND TABLE_NAME = ?";
  const auto result =
      con.query(query, {duckdb::Value(table.effective_schema(dialect)),
                        duckdb::Value(table.table_name)});
  return !result.rows.empty();
}

std::vector<std::string>
SchemaIntrospector::column_names(const table_def &table) {
  const auto &dialect = con.dialect();
  const std::string query =
      "SELECT COLUMN_NAME FROM INFORMATION_SCHEMA.COLUMNS WHERE "
      "TABLE_CATALOG = " +
      dialect.current_catalog_expression() +
      " AND TABLE_SCHEMA = ? AND TABLE_NAME = ? ORDER BY ORDINAL_POSITION";
  const auto result =
      con.query(query, {duckdb::Value(table.effective_schema(dialect)),
                        duckdb::Value(table.table_name)});

  std::vector<std::string> names;
  names.reserve(result.rows.size());
  for (const auto &row : result.rows) {
    names.push_back(row[0].ToString());
  }
  return names;
}

std::int64_t SchemaIntrospector::row_count(const table_def &table) {
  const auto result = con.query("SELECT COUNT(*) FROM " +
                                table.to_escaped_string(con.dialect()));
  return result.scalar().GetValue<int64_t>();
}

std::optional<std::int64_t>
SchemaIntrospector::max_value(const table_def &table,
                              const std::string &column) {
  const auto &dialect = con.dialect();
  const auto result =
      con.query("SELECT MAX(" + dialect.quote_identifier(column) + ") FROM " +
                table.to_escaped_string(dialect));
  const auto &max = result.scalar();
  if (max.IsNull()) {
    return std::nullopt;
  }
  return max.GetValue<int64_t>();
}

bool contains_column(const std::vector<std::string> &columns,
                     const std::string &column) {
  return std::find(columns.begin(), columns.end(), column) != columns.end();
}

std::vector<std::string>
find_missing_columns(const std::vector<std::string> &columns,
                     const std::vector<std::string> &available) {
  std::vector<std::string> missing;
  for (const auto &col : columns) {
    if (!contains_column(available, col)) {
      missing.push_back(col);
    }
  }
  return missing;
}
