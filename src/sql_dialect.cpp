#include "sql_dialect.hpp"

#include "duckdb.hpp"

#include <functional>
#include <sstream>
#include <string>
#include <vector>

void write_joined(
    std::ostringstream &sql, const SqlDialect &dialect,
    const std::vector<std::string> &columns,
    const std::function<void(const std::string &, std::ostringstream &)>
        &print_str,
    const std::string &separator) {
  bool first = true;
  for (const auto &col : columns) {
    if (first) {
      first = false;
    } else {
      sql << separator;
    }
    print_str(dialect.quote_identifier(col), sql);
  }
}

std::string
SqlDialect::row_number(const std::vector<std::string> &order_by) const {
  std::ostringstream out;
  out << "ROW_NUMBER() OVER (";
  bool first = true;
  for (const auto &expr : order_by) {
    out << (first ? "ORDER BY " : ", ") << expr;
    first = false;
  }
  out << ")";
  return out.str();
}

std::string
SqlDialect::join_condition(const std::vector<std::string> &join_keys) const {
  std::ostringstream out;
  write_joined(
      out, *this, join_keys,
      [](const std::string &quoted_col, std::ostringstream &sql) {
        sql << "tgt." << quoted_col << " = src." << quoted_col;
      },
      " AND ");
  return out.str();
}

// T-SQL

std::string TsqlDialect::quote_identifier(const std::string &identifier) const {
  // ] is escaped by doubling it
  std::string result;
  result.reserve(identifier.size() + 2);
  result += '[';
  for (const char c : identifier) {
    result += c;
    if (c == ']') {
      result += ']';
    }
  }
  result += ']';
  return result;
}

std::string TsqlDialect::clone_empty_table(const std::string &target_sql,
                                           const std::string &source_sql) const {
  return "SELECT * INTO " + target_sql + " FROM " + source_sql + " WHERE 1 = 0";
}

std::string TsqlDialect::add_column(const std::string &table_sql,
                                    const std::string &column,
                                    const std::string &type) const {
  return "ALTER TABLE " + table_sql + " ADD " + quote_identifier(column) + " " +
         type + " NULL";
}

std::string
TsqlDialect::row_number(const std::vector<std::string> &order_by) const {
  // T-SQL requires an ORDER BY inside OVER()
  if (order_by.empty()) {
    return "ROW_NUMBER() OVER (ORDER BY (SELECT NULL))";
  }
  return SqlDialect::row_number(order_by);
}

std::string TsqlDialect::update_from_join(
    const std::string &target_sql, const std::string &source_sql,
    const std::vector<std::string> &set_columns,
    const std::vector<std::string> &join_keys,
    const std::string &extra_condition) const {
  std::ostringstream sql;
  sql << "UPDATE tgt SET ";
  write_joined(sql, *this, set_columns,
               [](const std::string &quoted_col, std::ostringstream &out) {
                 out << "tgt." << quoted_col << " = src." << quoted_col;
               });
  sql << " FROM " << target_sql << " AS tgt INNER JOIN " << source_sql
      << " AS src ON " << join_condition(join_keys);
  if (!extra_condition.empty()) {
    sql << " WHERE " << extra_condition;
  }
  return sql.str();
}

// DuckDB

std::string
DuckDBDialect::quote_identifier(const std::string &identifier) const {
  return duckdb::KeywordHelper::WriteQuoted(identifier, '"');
}

std::string
DuckDBDialect::clone_empty_table(const std::string &target_sql,
                                 const std::string &source_sql) const {
  return "CREATE TABLE " + target_sql + " AS SELECT * FROM " + source_sql +
         " LIMIT 0";
}

std::string DuckDBDialect::add_column(const std::string &table_sql,
                                      const std::string &column,
                                      const std::string &type) const {
  return "ALTER TABLE " + table_sql + " ADD COLUMN " +
         quote_identifier(column) + " " + type;
}

std::string DuckDBDialect::update_from_join(
    const std::string &target_sql, const std::string &source_sql,
    const std::vector<std::string> &set_columns,
    const std::vector<std::string> &join_keys,
    const std::string &extra_condition) const {
  std::ostringstream sql;
  // SET targets cannot be qualified in DuckDB
  sql << "UPDATE " << target_sql << " AS tgt SET ";
  write_joined(sql, *this, set_columns,
               [](const std::string &quoted_col, std::ostringstream &out) {
                 out << quoted_col << " = src." << quoted_col;
               });
  sql << " FROM " << source_sql << " AS src WHERE "
      << join_condition(join_keys);
  if (!extra_condition.empty()) {
    sql << " AND " << extra_condition;
  }
  return sql.str();
}
