#pragma once

#include "config.hpp"
#include "ds_logging.hpp"
#include "row_count.hpp"
#include "table_name.hpp"
#include "warehouse_connection.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// One or more business key columns. A single column name converts
/// implicitly.
struct key_list {
  key_list(const char *key) : keys{std::string(key)} {}
  key_list(const std::string &key) : keys{key} {}
  key_list(std::vector<std::string> keys_) : keys(std::move(keys_)) {}
  key_list(std::initializer_list<std::string> keys_) : keys(keys_) {}

  std::vector<std::string> keys;
};

struct clone_result {
  bool created_table;
  bool added_surrogate_key;
};

struct merge_spec {
  table_def target;
  table_def source;
  std::vector<std::string> match_keys;
  std::string surrogate_key_column;
  std::vector<std::string> update_columns;
  std::vector<std::string> insert_columns;
  bool drop_source_after = false;
  /// Seed for the surrogate key when the target has no rows.
  std::int64_t default_start_id = config::DEFAULT_START_ID;
};

struct load_result {
  std::int64_t rows_updated = 0;
  std::int64_t rows_inserted = 0;
  row_count::origin inserted_count_origin = row_count::origin::reported;
};

/// Loads a staging table into a dimension table. Every entry point works on
/// the connection it is given, re-reads the schema of the involved tables and
/// runs its mutating statements in a single transaction. Table names are
/// "[schema].[table]", "[table]" or a bare identifier.
///
/// Concurrent loads into the same target race on the current maximum
/// surrogate key; callers serialize per target table.
class DimensionLoader {
public:
  explicit DimensionLoader(
      dslog::Logger &logger_,
      std::size_t insert_batch_size_ = config::DEFAULT_INSERT_BATCH_SIZE);

  /// Creates `target_table` as an empty copy of `source_table` if it does not
  /// exist, and adds `surrogate_key` (nullable BIGINT) when it is missing
  /// from a new or still empty target. A target holding rows is never
  /// altered.
  clone_result
  create_table_from_existing_schema(WarehouseConnection &con,
                                    const std::string &source_table,
                                    const std::string &target_table,
                                    const std::string &surrogate_key);

  /// Inserts the source rows whose business key is not yet in the target,
  /// numbering them max(surrogate_key) + 1, + 2, ... in business key order
  /// (`default_start_id` + 1, ... for an empty target). Only columns present
  /// in both tables are copied. Returns the number of inserted rows.
  std::int64_t insert_new_records_dynamic(
      WarehouseConnection &con, const std::string &source_table,
      const std::string &target_table, const std::string &surrogate_key,
      const key_list &business_key,
      std::int64_t default_start_id = config::DEFAULT_START_ID);

  /// Type-1 merge without MERGE: one UPDATE of matched rows followed by one
  /// INSERT of unmatched rows with window-numbered surrogate keys.
  load_result populate_table_from_source(WarehouseConnection &con,
                                         const merge_spec &spec);

  /// Overwrites `columns_to_update` of target rows that match a source row on
  /// `join_keys` and already have a surrogate key. Returns the affected rows
  /// as reported by the driver, 0 if it reports nothing.
  std::int64_t
  update_records_tsql(WarehouseConnection &con, const std::string &target_table,
                      const std::string &source_table,
                      const key_list &join_keys,
                      const std::string &surrogate_key,
                      const std::vector<std::string> &columns_to_update);

private:
  std::optional<std::int64_t>
  run_statement(WarehouseConnection &con, const std::string &log_prefix,
                const std::string &sql,
                const std::vector<duckdb::Value> &params = {});

  dslog::Logger &logger;
  std::size_t insert_batch_size;
};
