#include "validators.hpp"

#include "ds_error.hpp"
#include "sql_generator.hpp"
#include "table_name.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace validators {
namespace {
std::string describe_columns(const std::vector<std::string> &columns) {
  std::string result;
  for (const auto &col : columns) {
    if (!result.empty()) {
      result += ", ";
    }
    result += col;
  }
  return result;
}

void require_columns(const std::vector<std::string> &columns) {
  if (columns.empty()) {
    throw ds_error::ValidationError("At least one column must be given");
  }
}
} // namespace

void validate_table_no_nulls(WarehouseConnection &con,
                             const std::string &qualified_table,
                             const std::vector<std::string> &columns) {
  require_columns(columns);
  const auto table = parse_qualified_table(qualified_table);
  const MergeSqlGenerator sql_generator(con.dialect());

  const auto null_rows =
      con.query(sql_generator.count_null_rows(table, columns))
          .scalar()
          .GetValue<int64_t>();
  if (null_rows > 0) {
    throw ds_error::DataQualityError(
        "Found " + std::to_string(null_rows) + " rows with NULL values in " +
            "column(s) [" + describe_columns(columns) + "] of table " +
            table.to_string(),
        null_rows);
  }
}

void validate_table_uniqueness(WarehouseConnection &con,
                               const std::string &qualified_table,
                               const std::vector<std::string> &columns) {
  require_columns(columns);
  const auto table = parse_qualified_table(qualified_table);
  const MergeSqlGenerator sql_generator(con.dialect());

  const auto duplicate_groups =
      con.query(sql_generator.count_duplicate_keys(table, columns))
          .scalar()
          .GetValue<int64_t>();
  if (duplicate_groups > 0) {
    throw ds_error::DataQualityError(
        "Duplicate business keys found in table " + table.to_string() +
            ": " + std::to_string(duplicate_groups) +
            " key(s) over column(s) [" + describe_columns(columns) +
            "] occur more than once",
        duplicate_groups);
  }
}

} // namespace validators
