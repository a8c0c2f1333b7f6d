#include "dimension_loader.hpp"

#include "ds_error.hpp"
#include "row_count.hpp"
#include "schema_introspector.hpp"
#include "sql_generator.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
std::string join_names(const std::vector<std::string> &names) {
  std::string result;
  for (const auto &name : names) {
    if (!result.empty()) {
      result += ", ";
    }
    result += name;
  }
  return result;
}

void require_non_empty(const std::vector<std::string> &columns,
                       const std::string &argument_name) {
  if (columns.empty()) {
    throw ds_error::ValidationError("`" + argument_name +
                                    "` must be a non-empty list");
  }
  for (const auto &col : columns) {
    if (col.empty()) {
      throw ds_error::ValidationError("`" + argument_name +
                                      "` must not contain empty column names");
    }
  }
}

void require_table(SchemaIntrospector &introspector, const table_def &table,
                   const std::string &role) {
  if (!introspector.table_exists(table)) {
    throw ds_error::ValidationError(role + " table " + table.to_string() +
                                    " does not exist");
  }
}

void require_columns(const std::vector<std::string> &columns,
                     const std::vector<std::string> &available,
                     const std::string &argument_name,
                     const table_def &table) {
  const auto missing = find_missing_columns(columns, available);
  if (!missing.empty()) {
    throw ds_error::ValidationError("Column(s) of `" + argument_name +
                                    "` missing from table " +
                                    table.to_string() + ": " +
                                    join_names(missing));
  }
}
} // namespace

DimensionLoader::DimensionLoader(dslog::Logger &logger_,
                                 const std::size_t insert_batch_size_)
    : logger(logger_), insert_batch_size(insert_batch_size_) {
  if (insert_batch_size == 0) {
    throw std::invalid_argument("Insert batch size must be greater than 0");
  }
}

std::optional<std::int64_t>
DimensionLoader::run_statement(WarehouseConnection &con,
                               const std::string &log_prefix,
                               const std::string &sql,
                               const std::vector<duckdb::Value> &params) {
  logger.info(log_prefix + ": " + sql);
  return con.execute(sql, params);
}

clone_result DimensionLoader::create_table_from_existing_schema(
    WarehouseConnection &con, const std::string &source_table,
    const std::string &target_table, const std::string &surrogate_key) {
  const auto source = parse_qualified_table(source_table);
  const auto target = parse_qualified_table(target_table);
  SchemaIntrospector introspector(con);
  const MergeSqlGenerator sql_generator(con.dialect());

  clone_result result{false, false};
  try {
    if (!introspector.table_exists(target)) {
      require_table(introspector, source, "Source");
      const auto source_columns = introspector.column_names(source);

      Transaction transaction(con, logger);
      run_statement(con, "cloning table",
                    sql_generator.clone_table(target, source));
      result.created_table = true;
      if (!surrogate_key.empty() &&
          !contains_column(source_columns, surrogate_key)) {
        run_statement(con, "adding surrogate key",
                      sql_generator.add_surrogate_key(target, surrogate_key));
        result.added_surrogate_key = true;
      }
      transaction.commit();
      return result;
    }

    if (surrogate_key.empty() || introspector.row_count(target) > 0 ||
        contains_column(introspector.column_names(target), surrogate_key)) {
      logger.info("create_table_from_existing_schema: table <" +
                  target.to_string() + "> left unchanged");
      return result;
    }

    Transaction transaction(con, logger);
    run_statement(con, "adding surrogate key",
                  sql_generator.add_surrogate_key(target, surrogate_key));
    transaction.commit();
    result.added_surrogate_key = true;
    return result;
  } catch (const ds_error::DatabaseError &ex) {
    logger.severe("create_table_from_existing_schema failed for table <" +
                  target.to_string() + ">: " + ex.what());
    throw;
  }
}

std::int64_t DimensionLoader::insert_new_records_dynamic(
    WarehouseConnection &con, const std::string &source_table,
    const std::string &target_table, const std::string &surrogate_key,
    const key_list &business_key, const std::int64_t default_start_id) {
  const auto &keys = business_key.keys;
  if (keys.empty() ||
      std::any_of(keys.begin(), keys.end(),
                  [](const std::string &key) { return key.empty(); })) {
    throw ds_error::ValidationError(
        "`business_key` must be a string or a list of strings");
  }
  if (!surrogate_key.empty() && contains_column(keys, surrogate_key)) {
    throw ds_error::ValidationError("Surrogate key column " + surrogate_key +
                                    " must not be part of `business_key`");
  }

  const auto source = parse_qualified_table(source_table);
  const auto target = parse_qualified_table(target_table);
  SchemaIntrospector introspector(con);
  const MergeSqlGenerator sql_generator(con.dialect());

  try {
    require_table(introspector, source, "Source");
    require_table(introspector, target, "Target");

    const auto source_columns = introspector.column_names(source);
    const auto target_columns = introspector.column_names(target);

    std::vector<std::string> common_columns;
    for (const auto &col : source_columns) {
      if (col != surrogate_key && contains_column(target_columns, col)) {
        common_columns.push_back(col);
      }
    }
    if (common_columns.empty()) {
      throw ds_error::ValidationError(
          "No common columns between source table " + source.to_string() +
          " and target table " + target.to_string());
    }

    auto missing_keys = find_missing_columns(keys, source_columns);
    for (const auto &col : find_missing_columns(keys, target_columns)) {
      if (!contains_column(missing_keys, col)) {
        missing_keys.push_back(col);
      }
    }
    if (!missing_keys.empty()) {
      throw ds_error::ValidationError(
          "Business key(s) missing from source table " + source.to_string() +
          " or target table " + target.to_string() + ": " +
          join_names(missing_keys));
    }

    std::int64_t next_id = default_start_id;
    auto insert_columns = common_columns;
    if (!surrogate_key.empty()) {
      if (!contains_column(target_columns, surrogate_key)) {
        throw ds_error::ValidationError("Surrogate key column " +
                                        surrogate_key +
                                        " missing from target table " +
                                        target.to_string());
      }
      insert_columns.push_back(surrogate_key);
    }

    Transaction transaction(con, logger);

    if (!surrogate_key.empty()) {
      next_id = introspector.max_value(target, surrogate_key)
                    .value_or(default_start_id);
    }

    const auto select_sql = sql_generator.select_missing_rows(
        source, target, common_columns, keys);
    logger.info("selecting new records: " + select_sql);
    const auto new_rows = con.query(select_sql);

    const auto max_rows_per_batch = std::max<std::size_t>(
        1, std::min(insert_batch_size,
                    con.dialect().max_parameters() / insert_columns.size()));

    std::int64_t inserted = 0;
    for (std::size_t offset = 0; offset < new_rows.rows.size();
         offset += max_rows_per_batch) {
      const auto batch_rows =
          std::min(max_rows_per_batch, new_rows.rows.size() - offset);

      std::vector<duckdb::Value> params;
      params.reserve(batch_rows * insert_columns.size());
      for (std::size_t i = offset; i < offset + batch_rows; i++) {
        const auto &row = new_rows.rows[i];
        params.insert(params.end(), row.begin(), row.end());
        if (!surrogate_key.empty()) {
          params.push_back(duckdb::Value::BIGINT(++next_id));
        }
      }

      run_statement(
          con, "inserting new records",
          sql_generator.insert_values(target, insert_columns, batch_rows),
          params);
      inserted += static_cast<std::int64_t>(batch_rows);
    }

    transaction.commit();
    logger.info("insert_new_records_dynamic: inserted " +
                std::to_string(inserted) + " rows into <" +
                target.to_string() + ">");
    return inserted;
  } catch (const ds_error::DatabaseError &ex) {
    logger.severe("insert_new_records_dynamic failed for table <" +
                  target.to_string() + ">: " + ex.what());
    throw;
  }
}

load_result
DimensionLoader::populate_table_from_source(WarehouseConnection &con,
                                            const merge_spec &spec) {
  validate_identifiers(spec.target);
  validate_identifiers(spec.source);
  require_non_empty(spec.match_keys, "match_keys");
  require_non_empty(spec.update_columns, "update_columns");
  require_non_empty(spec.insert_columns, "insert_columns");
  if (spec.surrogate_key_column.empty()) {
    throw ds_error::ValidationError(
        "`surrogate_key_column` must not be empty");
  }
  if (contains_column(spec.update_columns, spec.surrogate_key_column) ||
      contains_column(spec.insert_columns, spec.surrogate_key_column)) {
    throw ds_error::ValidationError(
        "Surrogate key column " + spec.surrogate_key_column +
        " must not be listed in `update_columns` or `insert_columns`");
  }
  if (contains_column(spec.match_keys, spec.surrogate_key_column)) {
    throw ds_error::ValidationError("Surrogate key column " +
                                    spec.surrogate_key_column +
                                    " must not be part of `match_keys`");
  }

  SchemaIntrospector introspector(con);
  const MergeSqlGenerator sql_generator(con.dialect());
  const auto &sk = spec.surrogate_key_column;

  load_result result;
  try {
    require_table(introspector, spec.source, "Source");
    require_table(introspector, spec.target, "Target");

    const auto source_columns = introspector.column_names(spec.source);
    const auto target_columns = introspector.column_names(spec.target);
    require_columns(spec.match_keys, source_columns, "match_keys",
                    spec.source);
    require_columns(spec.match_keys, target_columns, "match_keys",
                    spec.target);
    require_columns(spec.update_columns, source_columns, "update_columns",
                    spec.source);
    require_columns(spec.update_columns, target_columns, "update_columns",
                    spec.target);
    require_columns(spec.insert_columns, source_columns, "insert_columns",
                    spec.source);
    require_columns(spec.insert_columns, target_columns, "insert_columns",
                    spec.target);
    require_columns({sk}, target_columns, "surrogate_key_column",
                    spec.target);

    Transaction transaction(con, logger);

    const auto max_id = introspector.max_value(spec.target, sk)
                            .value_or(spec.default_start_id);

    const auto updated = run_statement(
        con, "updating matched rows",
        sql_generator.update_matched(spec.target, spec.source,
                                     spec.update_columns, spec.match_keys));
    result.rows_updated = row_count::reported_or_zero(
        updated, "UPDATE of " + spec.target.to_string(), logger);

    const auto inserted = run_statement(
        con, "inserting unmatched rows",
        sql_generator.insert_unmatched(spec.target, spec.source,
                                       spec.insert_columns, spec.match_keys,
                                       sk, max_id));
    const auto resolved = row_count::resolve(
        inserted,
        [&]() {
          const auto count_sql =
              sql_generator.count_numbered_rows(spec.target, sk, max_id);
          logger.info("counting inserted rows: " + count_sql);
          return con.query(count_sql).scalar().GetValue<int64_t>();
        },
        logger);
    result.rows_inserted = resolved.rows;
    result.inserted_count_origin = resolved.from;

    if (spec.drop_source_after) {
      run_statement(con, "dropping source table",
                    sql_generator.drop_table(spec.source));
    }

    transaction.commit();
  } catch (const ds_error::DatabaseError &ex) {
    logger.severe(
        std::string(
            "Database error occurred during populate_table_from_source: ") +
        ex.what());
    throw;
  }

  logger.info("populate_table_from_source: <" + spec.target.to_string() +
              "> updated " + std::to_string(result.rows_updated) +
              " rows, inserted " + std::to_string(result.rows_inserted) +
              " rows (" + row_count::to_string(result.inserted_count_origin) +
              ")");
  return result;
}

std::int64_t DimensionLoader::update_records_tsql(
    WarehouseConnection &con, const std::string &target_table,
    const std::string &source_table, const key_list &join_keys,
    const std::string &surrogate_key,
    const std::vector<std::string> &columns_to_update) {
  require_non_empty(columns_to_update, "columns_to_update");
  require_non_empty(join_keys.keys, "join_keys");
  if (surrogate_key.empty()) {
    throw ds_error::ValidationError("`surrogate_key` must not be empty");
  }

  const auto target = parse_qualified_table(target_table);
  const auto source = parse_qualified_table(source_table);
  const MergeSqlGenerator sql_generator(con.dialect());

  try {
    Transaction transaction(con, logger);
    const auto updated = run_statement(
        con, "updating columns",
        sql_generator.update_keyed_rows(target, source, columns_to_update,
                                        join_keys.keys, surrogate_key));
    const auto rows = row_count::reported_or_zero(
        updated, "UPDATE of " + target.to_string(), logger);
    transaction.commit();
    return rows;
  } catch (const ds_error::DatabaseError &ex) {
    logger.severe("update_records_tsql failed for table <" +
                  target.to_string() + ">: " + ex.what());
    throw;
  }
}
