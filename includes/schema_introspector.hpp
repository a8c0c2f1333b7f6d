#pragma once

#include "table_name.hpp"
#include "warehouse_connection.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// Reads table metadata from the live connection. Nothing is cached: the
/// schema may change between two loads.
class SchemaIntrospector {
public:
  explicit SchemaIntrospector(WarehouseConnection &con_) : con(con_) {}

  bool table_exists(const table_def &table);

  /// Column names in ordinal order; empty if the table does not exist.
  std::vector<std::string> column_names(const table_def &table);

  std::int64_t row_count(const table_def &table);

  /// MAX(column), or std::nullopt for an empty table or all-NULL column.
  std::optional<std::int64_t> max_value(const table_def &table,
                                        const std::string &column);

private:
  WarehouseConnection &con;
};

/// Names of `columns` that are not in `available`, in the order given.
std::vector<std::string>
find_missing_columns(const std::vector<std::string> &columns,
                     const std::vector<std::string> &available);

bool contains_column(const std::vector<std::string> &columns,
                     const std::string &column);
