#pragma once

#include "ds_error.hpp"
#include "ds_logging.hpp"
#include "duckdb.hpp"
#include "duckdb_connection.hpp"
#include "sql_dialect.hpp"
#include "warehouse_connection.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers {

// In-memory DuckDB warehouse, one per test case
struct test_warehouse {
  duckdb::DuckDB db;
  DuckDBWarehouseConnection con{db};

  void run(const std::string &sql) { con.execute(sql); }

  std::int64_t count(const std::string &sql) {
    return con.query(sql).scalar().GetValue<int64_t>();
  }
};

// Keeps every log line so tests can look for warnings
class RecordingSink final : public dslog::LogSink {
public:
  void write(const std::string &level, const std::string &message) override {
    lines.emplace_back(level, message);
  }

  bool contains(const std::string &level, const std::string &substring) const {
    for (const auto &line : lines) {
      if (line.first == level &&
          line.second.find(substring) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  std::size_t count(const std::string &level) const {
    std::size_t result = 0;
    for (const auto &line : lines) {
      if (line.first == level) {
        result++;
      }
    }
    return result;
  }

  std::vector<std::pair<std::string, std::string>> lines;
};

struct recording_logger {
  recording_logger() : logger(dslog::Logger::CreateStdoutLogger()) {
    logger.add_sink(sink);
  }

  std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
  dslog::Logger logger;
};

// DuckDB connection that behaves like an ODBC bridge without row counts:
// INSERTs report nothing, and optionally the fallback COUNT(*) fails.
class CountlessConnection final : public WarehouseConnection {
public:
  explicit CountlessConnection(WarehouseConnection &inner_,
                               bool fail_count_queries_ = false)
      : inner(inner_), fail_count_queries(fail_count_queries_) {}

  const SqlDialect &dialect() const override { return inner.dialect(); }

  std::optional<std::int64_t>
  execute(const std::string &sql,
          const std::vector<duckdb::Value> &params = {}) override {
    const auto count = inner.execute(sql, params);
    if (sql.rfind("INSERT", 0) == 0) {
      return std::nullopt;
    }
    return count;
  }

  result_set query(const std::string &sql,
                   const std::vector<duckdb::Value> &params = {}) override {
    if (fail_count_queries && sql.rfind("SELECT COUNT(*)", 0) == 0) {
      throw ds_error::DatabaseError("Query failed <" + sql +
                                    ">: simulated driver failure");
    }
    return inner.query(sql, params);
  }

  void begin_transaction() override { inner.begin_transaction(); }
  void commit() override { inner.commit(); }
  void rollback() override { inner.rollback(); }

private:
  WarehouseConnection &inner;
  bool fail_count_queries;
};

// T-SQL connection that records statements instead of running them
class RecordingConnection final : public WarehouseConnection {
public:
  const SqlDialect &dialect() const override { return tsql; }

  std::optional<std::int64_t>
  execute(const std::string &sql,
          const std::vector<duckdb::Value> &params = {}) override {
    if (!fail_with.empty()) {
      throw ds_error::DatabaseError(fail_with);
    }
    statements.push_back(sql);
    return reported_count;
  }

  result_set query(const std::string &sql,
                   const std::vector<duckdb::Value> &params = {}) override {
    throw ds_error::DatabaseError("Queries are not supported: " + sql);
  }

  void begin_transaction() override { statements.emplace_back("BEGIN"); }
  void commit() override { statements.emplace_back("COMMIT"); }
  void rollback() override { statements.emplace_back("ROLLBACK"); }

  std::vector<std::string> statements;
  std::optional<std::int64_t> reported_count;
  std::string fail_with;

private:
  TsqlDialect tsql;
};

} // namespace test_helpers
