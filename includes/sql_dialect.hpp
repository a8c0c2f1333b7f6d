#pragma once

#include <cstddef>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

/// Everything about the generated SQL that differs between warehouse
/// families. Identifiers passed in are raw names; the dialect quotes them.
/// Arguments named `*_sql` are already-quoted table references.
class SqlDialect {
public:
  virtual ~SqlDialect() = default;

  [[nodiscard]] virtual std::string
  quote_identifier(const std::string &identifier) const = 0;

  /// Schema that unqualified table names resolve to.
  [[nodiscard]] virtual std::string default_schema() const = 0;

  /// Expression returning the name of the current database, used to restrict
  /// INFORMATION_SCHEMA lookups.
  [[nodiscard]] virtual std::string current_catalog_expression() const = 0;

  /// Upper bound for bound parameters in a single statement.
  [[nodiscard]] virtual std::size_t max_parameters() const = 0;

  [[nodiscard]] virtual std::string surrogate_key_type() const {
    return "BIGINT";
  }

  /// Creates `target_sql` with the columns of `source_sql` and no rows.
  [[nodiscard]] virtual std::string
  clone_empty_table(const std::string &target_sql,
                    const std::string &source_sql) const = 0;

  /// Adds a nullable column.
  [[nodiscard]] virtual std::string
  add_column(const std::string &table_sql, const std::string &column,
             const std::string &type) const = 0;

  /// `ROW_NUMBER() OVER (...)` over the already-qualified `order_by`
  /// expressions.
  [[nodiscard]] virtual std::string
  row_number(const std::vector<std::string> &order_by) const;

  /// UPDATE of `target_sql` (alias tgt) from `source_sql` (alias src) joined
  /// on `join_keys`, copying `set_columns` from src. `extra_condition` is an
  /// optional predicate over the aliases, AND-ed to the join.
  [[nodiscard]] virtual std::string
  update_from_join(const std::string &target_sql, const std::string &source_sql,
                   const std::vector<std::string> &set_columns,
                   const std::vector<std::string> &join_keys,
                   const std::string &extra_condition) const = 0;

protected:
  /// `tgt.<k1> = src.<k1> AND tgt.<k2> = src.<k2> ...`
  [[nodiscard]] std::string
  join_condition(const std::vector<std::string> &join_keys) const;
};

/// SQL Server, Azure SQL and Fabric warehouses.
class TsqlDialect final : public SqlDialect {
public:
  [[nodiscard]] std::string
  quote_identifier(const std::string &identifier) const override;
  [[nodiscard]] std::string default_schema() const override { return "dbo"; }
  [[nodiscard]] std::string current_catalog_expression() const override {
    return "DB_NAME()";
  }
  // SQL Server rejects more than 2100 parameters; keep headroom.
  [[nodiscard]] std::size_t max_parameters() const override { return 2000; }
  [[nodiscard]] std::string
  clone_empty_table(const std::string &target_sql,
                    const std::string &source_sql) const override;
  [[nodiscard]] std::string add_column(const std::string &table_sql,
                                       const std::string &column,
                                       const std::string &type) const override;
  [[nodiscard]] std::string
  row_number(const std::vector<std::string> &order_by) const override;
  [[nodiscard]] std::string
  update_from_join(const std::string &target_sql, const std::string &source_sql,
                   const std::vector<std::string> &set_columns,
                   const std::vector<std::string> &join_keys,
                   const std::string &extra_condition) const override;
};

class DuckDBDialect final : public SqlDialect {
public:
  [[nodiscard]] std::string
  quote_identifier(const std::string &identifier) const override;
  [[nodiscard]] std::string default_schema() const override { return "main"; }
  [[nodiscard]] std::string current_catalog_expression() const override {
    return "current_database()";
  }
  [[nodiscard]] std::size_t max_parameters() const override { return 65535; }
  [[nodiscard]] std::string
  clone_empty_table(const std::string &target_sql,
                    const std::string &source_sql) const override;
  [[nodiscard]] std::string add_column(const std::string &table_sql,
                                       const std::string &column,
                                       const std::string &type) const override;
  [[nodiscard]] std::string
  update_from_join(const std::string &target_sql, const std::string &source_sql,
                   const std::vector<std::string> &set_columns,
                   const std::vector<std::string> &join_keys,
                   const std::string &extra_condition) const override;
};

/// Writes `columns` quoted by `dialect`, each passed through `print_str`,
/// separated by `separator`.
void write_joined(
    std::ostringstream &sql, const SqlDialect &dialect,
    const std::vector<std::string> &columns,
    const std::function<void(const std::string &, std::ostringstream &)>
        &print_str,
    const std::string &separator = ", ");
