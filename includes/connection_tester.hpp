#pragma once

#include "warehouse_connection.hpp"

#include <array>
#include <cassert>
#include <string>
#include <utility>

/// Pre-flight checks of a warehouse connection, run before the first load.
namespace connection_tester {
inline constexpr const char *TEST_CONNECTIVITY = "test_connectivity";
inline constexpr const char *TEST_WRITE_ROLLBACK = "test_write_rollback";
inline constexpr const char *TEST_ROW_COUNTS = "test_row_counts";

struct TestCase {
  explicit TestCase(std::string name_, std::string description_)
      : name(std::move(name_)), description(std::move(description_)) {}

  std::string name;
  std::string description;
};

struct TestResult {
  explicit TestResult(const bool success_, std::string failure_message_ = "")
      : success(success_), failure_message(std::move(failure_message_)) {
    assert(success && failure_message.empty() ||
           !success && !failure_message.empty());
  }

  bool success;
  std::string failure_message;
};

std::array<TestCase, 3> get_test_cases();

/// Throws std::runtime_error for an unknown test name.
TestResult run_test(const std::string &test_name, WarehouseConnection &con);
} // namespace connection_tester
