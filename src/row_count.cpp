#include "row_count.hpp"

#include "ds_error.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace row_count {

std::string to_string(const origin from) {
  switch (from) {
  case origin::reported:
    return "reported";
  case origin::counted:
    return "counted";
  case origin::unavailable:
    return "unavailable";
  }
  return "unknown";
}

resolution resolve(const std::optional<std::int64_t> &reported,
                   const std::function<std::int64_t()> &fallback_count,
                   dslog::Logger &logger) {
  if (reported.has_value() && reported.value() >= 0) {
    return {origin::reported, reported.value()};
  }

  try {
    return {origin::counted, fallback_count()};
  } catch (const ds_error::DatabaseError &ex) {
    logger.warning(
        std::string("Could not determine row count from fallback count SQL: ") +
        ex.what());
    return {origin::unavailable, 0};
  }
}

std::int64_t reported_or_zero(const std::optional<std::int64_t> &reported,
                              const std::string &statement_name,
                              dslog::Logger &logger) {
  if (reported.has_value() && reported.value() >= 0) {
    return reported.value();
  }
  logger.warning("Driver did not report a row count for " + statement_name +
                 "; assuming 0 rows");
  return 0;
}

} // namespace row_count
