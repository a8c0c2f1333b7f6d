#include "connection_tester.hpp"

#include "ds_error.hpp"
#include "schema_introspector.hpp"
#include "table_name.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace connection_tester {
namespace {
const table_def SCRATCH_TABLE{std::nullopt, "__dimsync_test_table"};

/// Rolls back and returns the failure, extended by the rollback error if the
/// rollback failed too
TestResult fail_and_rollback(WarehouseConnection &con,
                             const std::string &failure_message) {
  try {
    con.rollback();
  } catch (const ds_error::DatabaseError &ex) {
    return TestResult(false, failure_message +
                                 "; rolling back failed as well: " +
                                 ex.what());
  }
  return TestResult(false, failure_message);
}

/// Checks that the connection can run a trivial query
TestResult run_connectivity_test(WarehouseConnection &con) {
  try {
    const auto one = con.query("SELECT 1").scalar().GetValue<int64_t>();
    if (one != 1) {
      return TestResult(false, "SELECT 1 returned " + std::to_string(one));
    }
  } catch (const ds_error::DatabaseError &ex) {
    return TestResult(false, ex.what());
  }
  return TestResult(true);
}

/// Checks that a table can be created and written in a transaction and that
/// it is gone after rolling back
TestResult run_write_rollback_test(WarehouseConnection &con) {
  const auto table_name = SCRATCH_TABLE.to_escaped_string(con.dialect());
  try {
    con.begin_transaction();
  } catch (const ds_error::DatabaseError &ex) {
    return TestResult(false,
                      std::string("Could not begin transaction: ") + ex.what());
  }

  std::int64_t row_count;
  try {
    con.execute("CREATE TABLE " + table_name + " (id INTEGER, value VARCHAR(32))");
    con.execute("INSERT INTO " + table_name + " VALUES (1, 'test_value')");
    row_count = con.query("SELECT COUNT(*) FROM " + table_name)
                    .scalar()
                    .GetValue<int64_t>();
  } catch (const ds_error::DatabaseError &ex) {
    return fail_and_rollback(con, "Could not write to table \"" +
                                      SCRATCH_TABLE.to_string() +
                                      "\": " + ex.what());
  }

  if (row_count != 1) {
    return fail_and_rollback(con, "Expected 1 row in test table, got " +
                                      std::to_string(row_count));
  }

  try {
    con.rollback();
    if (SchemaIntrospector(con).table_exists(SCRATCH_TABLE)) {
      return TestResult(false, "Table \"" + SCRATCH_TABLE.to_string() +
                                   "\" still exists after rolling back");
    }
  } catch (const ds_error::DatabaseError &ex) {
    return TestResult(false, "Could not roll back transaction for table \"" +
                                 SCRATCH_TABLE.to_string() +
                                 "\": " + ex.what());
  }
  return TestResult(true);
}

/// Checks that the driver either reports the correct number of inserted rows
/// or none at all. A wrong count cannot be told apart from a real one.
TestResult run_row_counts_test(WarehouseConnection &con) {
  const auto table_name = SCRATCH_TABLE.to_escaped_string(con.dialect());
  try {
    con.begin_transaction();
  } catch (const ds_error::DatabaseError &ex) {
    return TestResult(false,
                      std::string("Could not begin transaction: ") + ex.what());
  }

  std::optional<std::int64_t> reported;
  try {
    con.execute("CREATE TABLE " + table_name + " (id INTEGER)");
    reported = con.execute("INSERT INTO " + table_name +
                           " (id) SELECT 1 UNION ALL SELECT 2");
  } catch (const ds_error::DatabaseError &ex) {
    return fail_and_rollback(con, "Could not insert into table \"" +
                                      SCRATCH_TABLE.to_string() +
                                      "\": " + ex.what());
  }

  if (reported.has_value() && reported.value() >= 0 &&
      reported.value() != 2) {
    return fail_and_rollback(
        con, "Driver reported " + std::to_string(reported.value()) +
                 " affected rows for an INSERT of 2 rows");
  }

  try {
    con.rollback();
  } catch (const ds_error::DatabaseError &ex) {
    return TestResult(false, "Could not roll back transaction for table \"" +
                                 SCRATCH_TABLE.to_string() +
                                 "\": " + ex.what());
  }
  return TestResult(true);
}
} // namespace

std::array<TestCase, 3> get_test_cases() {
  return {TestCase{TEST_CONNECTIVITY, "Test that the warehouse is reachable"},
          TestCase{TEST_WRITE_ROLLBACK,
                   "Test write permissions and transaction rollback"},
          TestCase{TEST_ROW_COUNTS,
                   "Test that reported row counts can be trusted"}};
}

TestResult run_test(const std::string &test_name, WarehouseConnection &con) {
  if (test_name == TEST_CONNECTIVITY) {
    return run_connectivity_test(con);
  }
  if (test_name == TEST_WRITE_ROLLBACK) {
    return run_write_rollback_test(con);
  }
  if (test_name == TEST_ROW_COUNTS) {
    return run_row_counts_test(con);
  }
  throw std::runtime_error("Unknown test name: " + test_name);
}
} // namespace connection_tester
