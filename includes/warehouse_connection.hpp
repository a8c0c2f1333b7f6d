#pragma once

#include "ds_logging.hpp"
#include "duckdb.hpp"
#include "sql_dialect.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// Materialized rows of a query.
struct result_set {
  std::vector<std::vector<duckdb::Value>> rows;

  /// The single value of a one-row, one-column result.
  [[nodiscard]] const duckdb::Value &scalar() const;
};

/// An open, already-authenticated connection to a warehouse. How it was
/// obtained (driver, credentials, pooling) is not this library's business.
/// All methods throw ds_error::DatabaseError on failure.
class WarehouseConnection {
public:
  virtual ~WarehouseConnection() = default;

  [[nodiscard]] virtual const SqlDialect &dialect() const = 0;

  /// Runs a statement. Returns the number of affected rows when the driver
  /// reports one; some ODBC bridges report nothing (or -1) for INSERT ...
  /// SELECT, in which case std::nullopt or a negative value comes back.
  virtual std::optional<std::int64_t>
  execute(const std::string &sql,
          const std::vector<duckdb::Value> &params = {}) = 0;

  virtual result_set query(const std::string &sql,
                           const std::vector<duckdb::Value> &params = {}) = 0;

  virtual void begin_transaction() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;
};

/// BEGIN on construction; ROLLBACK on destruction unless commit() succeeded.
/// Must not outlive the connection.
class Transaction final {
public:
  Transaction(WarehouseConnection &con_, dslog::Logger &logger_);
  ~Transaction();

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit();

private:
  WarehouseConnection &con;
  dslog::Logger &logger;
  bool finished = false;
};
