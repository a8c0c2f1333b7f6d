#include "warehouse_connection.hpp"

#include "ds_error.hpp"

#include <string>

const duckdb::Value &result_set::scalar() const {
  if (rows.size() != 1 || rows.front().size() != 1) {
    throw ds_error::DatabaseError(
        "Expected a single value but the query returned " +
        std::to_string(rows.size()) + " rows");
  }
  return rows.front().front();
}

Transaction::Transaction(WarehouseConnection &con_, dslog::Logger &logger_)
    : con(con_), logger(logger_) {
  con.begin_transaction();
}

Transaction::~Transaction() {
  if (finished) {
    return;
  }
  // Only log errors during ROLLBACK; the original error is already in flight
  try {
    con.rollback();
    logger.info("    transaction rolled back");
  } catch (const ds_error::DatabaseError &ex) {
    logger.warning(std::string("Failed to roll back transaction: ") +
                   ex.what());
  }
}

void Transaction::commit() {
  con.commit();
  finished = true;
}
