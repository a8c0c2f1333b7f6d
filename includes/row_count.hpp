#pragma once

#include "ds_logging.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace row_count {

enum class origin {
  /// The driver returned a usable count.
  reported,
  /// The driver did not; the fallback query counted the rows.
  counted,
  /// Neither worked; the count is 0.
  unavailable
};

struct resolution {
  origin from;
  std::int64_t rows;
};

std::string to_string(origin from);

/// Uses `reported` when it holds a non-negative value and otherwise runs
/// `fallback_count`. A ds_error::DatabaseError from the fallback is logged as
/// a warning and yields {unavailable, 0}; the statement that produced the rows
/// already succeeded.
resolution resolve(const std::optional<std::int64_t> &reported,
                   const std::function<std::int64_t()> &fallback_count,
                   dslog::Logger &logger);

/// Count of a statement whose count is informational only: a missing count is
/// logged as a warning and taken as 0.
std::int64_t reported_or_zero(const std::optional<std::int64_t> &reported,
                              const std::string &statement_name,
                              dslog::Logger &logger);

} // namespace row_count
