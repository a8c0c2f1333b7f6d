#pragma once

#include "warehouse_connection.hpp"

#include <string>
#include <vector>

/// Pre-load data-quality gates over the business key of a table. Both run a
/// single read-only query and throw ds_error::DataQualityError carrying the
/// number of offending rows (or key groups).
namespace validators {

/// Fails if any row has a NULL in one of `columns`.
void validate_table_no_nulls(WarehouseConnection &con,
                             const std::string &qualified_table,
                             const std::vector<std::string> &columns);

/// Fails if the `columns` tuple is not unique.
void validate_table_uniqueness(WarehouseConnection &con,
                               const std::string &qualified_table,
                               const std::vector<std::string> &columns);

} // namespace validators
