#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ds_error {

/// Malformed qualified table name, or a schema/table part that is not a plain
/// SQL identifier.
class InvalidIdentifier : public std::invalid_argument {
public:
  explicit InvalidIdentifier(const std::string &msg) : invalid_argument(msg) {}
};

/// Caller input that can be rejected before any statement mutates data.
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string &msg) : invalid_argument(msg) {}
};

/// A pre-load gate found offending rows (null or duplicate business keys).
class DataQualityError : public std::runtime_error {
public:
  DataQualityError(const std::string &msg, std::int64_t violations_)
      : runtime_error(msg), violations(violations_) {}

  /// Offending rows (null check) or key groups (uniqueness check).
  [[nodiscard]] std::int64_t violation_count() const { return violations; }

private:
  std::int64_t violations;
};

/// Any failure reported by the driver or the transaction. Never swallowed:
/// the state of the surrounding transaction is unknown once this is thrown.
class DatabaseError : public std::runtime_error {
public:
  explicit DatabaseError(const std::string &msg) : runtime_error(msg) {}
};

} // namespace ds_error
