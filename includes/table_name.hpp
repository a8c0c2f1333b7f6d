#pragma once

#include "sql_dialect.hpp"

#include <optional>
#include <string>

/// A table name, optionally schema-qualified. Both parts are plain SQL
/// identifiers; they are quoted by the dialect whenever they end up in SQL.
struct table_def {
  std::optional<std::string> schema_name;
  std::string table_name;

  /// Quoted form for SQL: <schema>.<table>, or <table> alone without schema.
  [[nodiscard]] std::string to_escaped_string(const SqlDialect &dialect) const;
  /// Unquoted form for messages: schema.table, or table alone.
  [[nodiscard]] std::string to_string() const;
  /// The schema lookups should use: the given one or the dialect default.
  [[nodiscard]] std::string
  effective_schema(const SqlDialect &dialect) const;
};

/// Parses "[schema].[table]", "[table]" or a bare "table". Anything else,
/// including "schema.table" and "", throws ds_error::InvalidIdentifier.
table_def parse_qualified_table(const std::string &qualified_table);

/// True for [A-Za-z_][A-Za-z0-9_]*.
bool is_valid_identifier(const std::string &identifier);

/// Throws ds_error::InvalidIdentifier unless `table` and, if given and
/// non-empty, `schema` are valid identifiers.
void validate_identifiers(const std::optional<std::string> &schema,
                          const std::string &table);

inline void validate_identifiers(const table_def &table) {
  validate_identifiers(table.schema_name, table.table_name);
}

/// "schema.table" when schema is non-empty, "table" otherwise.
std::string qualify_table_name(const std::optional<std::string> &schema,
                               const std::string &table);
