#include "sql_generator.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace {
const auto print_column = [](const std::string &quoted_col,
                             std::ostringstream &out) { out << quoted_col; };
}

std::string
MergeSqlGenerator::not_in_target(const table_def &target,
                                 const std::vector<std::string> &keys) const {
  std::ostringstream sql;
  sql << "NOT EXISTS (SELECT 1 FROM " << target.to_escaped_string(dialect)
      << " AS tgt WHERE ";
  write_joined(
      sql, dialect, keys,
      [](const std::string &quoted_col, std::ostringstream &out) {
        out << "tgt." << quoted_col << " = src." << quoted_col;
      },
      " AND ");
  sql << ")";
  return sql.str();
}

std::string MergeSqlGenerator::select_missing_rows(
    const table_def &source, const table_def &target,
    const std::vector<std::string> &columns,
    const std::vector<std::string> &keys) const {
  const auto qualify_src = [](const std::string &quoted_col,
                              std::ostringstream &out) {
    out << "src." << quoted_col;
  };

  std::ostringstream sql;
  sql << "SELECT ";
  write_joined(sql, dialect, columns, qualify_src);
  sql << " FROM " << source.to_escaped_string(dialect) << " AS src WHERE "
      << not_in_target(target, keys) << " ORDER BY ";
  write_joined(sql, dialect, keys, qualify_src);
  return sql.str();
}

std::string
MergeSqlGenerator::insert_values(const table_def &target,
                                 const std::vector<std::string> &columns,
                                 const std::size_t row_count) const {
  std::ostringstream placeholders;
  placeholders << "(";
  for (std::size_t i = 0; i < columns.size(); i++) {
    placeholders << (i == 0 ? "?" : ", ?");
  }
  placeholders << ")";
  const auto row = placeholders.str();

  std::ostringstream sql;
  sql << "INSERT INTO " << target.to_escaped_string(dialect) << " (";
  write_joined(sql, dialect, columns, print_column);
  sql << ") VALUES ";
  for (std::size_t i = 0; i < row_count; i++) {
    if (i > 0) {
      sql << ", ";
    }
    sql << row;
  }
  return sql.str();
}

std::string MergeSqlGenerator::update_matched(
    const table_def &target, const table_def &source,
    const std::vector<std::string> &update_columns,
    const std::vector<std::string> &match_keys) const {
  return dialect.update_from_join(target.to_escaped_string(dialect),
                                  source.to_escaped_string(dialect),
                                  update_columns, match_keys, "");
}

std::string MergeSqlGenerator::update_keyed_rows(
    const table_def &target, const table_def &source,
    const std::vector<std::string> &columns,
    const std::vector<std::string> &join_keys,
    const std::string &surrogate_key) const {
  return dialect.update_from_join(
      target.to_escaped_string(dialect), source.to_escaped_string(dialect),
      columns, join_keys,
      "tgt." + dialect.quote_identifier(surrogate_key) + " IS NOT NULL");
}

std::string MergeSqlGenerator::insert_unmatched(
    const table_def &target, const table_def &source,
    const std::vector<std::string> &insert_columns,
    const std::vector<std::string> &match_keys,
    const std::string &surrogate_key, const std::int64_t max_id) const {
  std::vector<std::string> order_by;
  for (const auto &key : match_keys) {
    order_by.push_back("src." + dialect.quote_identifier(key));
  }

  std::ostringstream sql;
  sql << "INSERT INTO " << target.to_escaped_string(dialect) << " ("
      << dialect.quote_identifier(surrogate_key) << ", ";
  write_joined(sql, dialect, insert_columns, print_column);
  sql << ") SELECT " << max_id << " + numbered_rows.rn AS "
      << dialect.quote_identifier(surrogate_key) << ", ";
  write_joined(sql, dialect, insert_columns,
               [](const std::string &quoted_col, std::ostringstream &out) {
                 out << "numbered_rows." << quoted_col;
               });
  sql << " FROM (SELECT ";
  write_joined(sql, dialect, insert_columns,
               [](const std::string &quoted_col, std::ostringstream &out) {
                 out << "src." << quoted_col;
               });
  sql << ", " << dialect.row_number(order_by) << " AS rn FROM "
      << source.to_escaped_string(dialect) << " AS src WHERE "
      << not_in_target(target, match_keys) << ") AS numbered_rows";
  return sql.str();
}

std::string
MergeSqlGenerator::count_numbered_rows(const table_def &target,
                                       const std::string &surrogate_key,
                                       const std::int64_t max_id) const {
  return "SELECT COUNT(*) FROM " + target.to_escaped_string(dialect) +
         " WHERE " + dialect.quote_identifier(surrogate_key) + " > " +
         std::to_string(max_id);
}

std::string
MergeSqlGenerator::count_null_rows(const table_def &table,
                                   const std::vector<std::string> &columns) const {
  std::ostringstream sql;
  sql << "SELECT COUNT(*) FROM " << table.to_escaped_string(dialect)
      << " WHERE ";
  write_joined(
      sql, dialect, columns,
      [](const std::string &quoted_col, std::ostringstream &out) {
        out << quoted_col << " IS NULL";
      },
      " OR ");
  return sql.str();
}

std::string MergeSqlGenerator::count_duplicate_keys(
    const table_def &table, const std::vector<std::string> &columns) const {
  std::ostringstream sql;
  sql << "SELECT COUNT(*) FROM (SELECT ";
  write_joined(sql, dialect, columns, print_column);
  sql << " FROM " << table.to_escaped_string(dialect) << " GROUP BY ";
  write_joined(sql, dialect, columns, print_column);
  sql << " HAVING COUNT(*) > 1) AS duplicate_keys";
  return sql.str();
}

std::string MergeSqlGenerator::clone_table(const table_def &target,
                                           const table_def &source) const {
  return dialect.clone_empty_table(target.to_escaped_string(dialect),
                                   source.to_escaped_string(dialect));
}

std::string
MergeSqlGenerator::add_surrogate_key(const table_def &table,
                                     const std::string &column) const {
  return dialect.add_column(table.to_escaped_string(dialect), column,
                            dialect.surrogate_key_type());
}

std::string MergeSqlGenerator::drop_table(const table_def &table) const {
  return "DROP TABLE IF EXISTS " + table.to_escaped_string(dialect);
}
