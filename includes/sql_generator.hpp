#pragma once

#include "sql_dialect.hpp"
#include "table_name.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/// Builds the statements of the loader. Table names come in as validated
/// table_defs and column names are always quoted by the dialect; row values
/// are never part of the text and travel as `?` parameters.
class MergeSqlGenerator {
public:
  explicit MergeSqlGenerator(const SqlDialect &dialect_) : dialect(dialect_) {}

  /// Source rows (`columns` only) whose `keys` tuple has no counterpart in
  /// the target, ordered by `keys`.
  [[nodiscard]] std::string
  select_missing_rows(const table_def &source, const table_def &target,
                      const std::vector<std::string> &columns,
                      const std::vector<std::string> &keys) const;

  /// Multi-row INSERT ... VALUES with `row_count` groups of placeholders.
  [[nodiscard]] std::string
  insert_values(const table_def &target,
                const std::vector<std::string> &columns,
                std::size_t row_count) const;

  /// UPDATE of target rows matching a source row on all `match_keys`.
  [[nodiscard]] std::string
  update_matched(const table_def &target, const table_def &source,
                 const std::vector<std::string> &update_columns,
                 const std::vector<std::string> &match_keys) const;

  /// Same shape as update_matched, restricted to target rows that already
  /// carry a surrogate key.
  [[nodiscard]] std::string
  update_keyed_rows(const table_def &target, const table_def &source,
                    const std::vector<std::string> &columns,
                    const std::vector<std::string> &join_keys,
                    const std::string &surrogate_key) const;

  /// INSERT of unmatched source rows; the surrogate key of each row is
  /// `max_id` plus its ROW_NUMBER() within the numbered_rows subquery.
  [[nodiscard]] std::string
  insert_unmatched(const table_def &target, const table_def &source,
                   const std::vector<std::string> &insert_columns,
                   const std::vector<std::string> &match_keys,
                   const std::string &surrogate_key,
                   std::int64_t max_id) const;

  /// Rows numbered by insert_unmatched as they landed in the target.
  [[nodiscard]] std::string count_numbered_rows(const table_def &target,
                                                const std::string &surrogate_key,
                                                std::int64_t max_id) const;

  [[nodiscard]] std::string
  count_null_rows(const table_def &table,
                  const std::vector<std::string> &columns) const;

  [[nodiscard]] std::string
  count_duplicate_keys(const table_def &table,
                       const std::vector<std::string> &columns) const;

  [[nodiscard]] std::string clone_table(const table_def &target,
                                        const table_def &source) const;

  [[nodiscard]] std::string add_surrogate_key(const table_def &table,
                                              const std::string &column) const;

  [[nodiscard]] std::string drop_table(const table_def &table) const;

private:
  /// NOT EXISTS (SELECT 1 FROM <target> AS tgt WHERE tgt.k = src.k ...)
  [[nodiscard]] std::string
  not_in_target(const table_def &target,
                const std::vector<std::string> &keys) const;

  const SqlDialect &dialect;
};
