#include "table_name.hpp"

#include "ds_error.hpp"

#include <optional>
#include <string>

namespace {
const std::string EXPECTED_FORMAT =
    "not in the format '[schema].[table]' or '[table]'";

bool has_schema(const std::optional<std::string> &schema) {
  return schema.has_value() && !schema->empty();
}

/// Returns the content of "[name]" or std::nullopt when `part` is not
/// bracketed or contains further brackets.
std::optional<std::string> strip_brackets(const std::string &part) {
  if (part.size() < 3 || part.front() != '[' || part.back() != ']') {
    return std::nullopt;
  }
  const auto inner = part.substr(1, part.size() - 2);
  if (inner.find_first_of("[]") != std::string::npos) {
    return std::nullopt;
  }
  return inner;
}

[[noreturn]] void throw_bad_format(const std::string &qualified_table) {
  throw ds_error::InvalidIdentifier("Table name <" + qualified_table + "> is " +
                                    EXPECTED_FORMAT);
}
} // namespace

bool is_valid_identifier(const std::string &identifier) {
  if (identifier.empty()) {
    return false;
  }
  const auto is_alpha = [](const char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  };
  if (!is_alpha(identifier.front())) {
    return false;
  }
  for (const char c : identifier) {
    if (!is_alpha(c) && !(c >= '0' && c <= '9')) {
      return false;
    }
  }
  return true;
}

void validate_identifiers(const std::optional<std::string> &schema,
                          const std::string &table) {
  if (has_schema(schema) && !is_valid_identifier(*schema)) {
    throw ds_error::InvalidIdentifier("Invalid schema name <" + *schema +
                                      ">: only letters, digits and underscores "
                                      "are allowed");
  }
  if (!is_valid_identifier(table)) {
    throw ds_error::InvalidIdentifier("Invalid table name <" + table +
                                      ">: only letters, digits and underscores "
                                      "are allowed");
  }
}

table_def parse_qualified_table(const std::string &qualified_table) {
  if (qualified_table.empty()) {
    throw_bad_format(qualified_table);
  }

  table_def result;
  if (qualified_table.front() != '[') {
    // bare word: no brackets, no separators
    if (qualified_table.find_first_of("[]. \t") != std::string::npos) {
      throw_bad_format(qualified_table);
    }
    result.table_name = qualified_table;
  } else {
    const auto separator = qualified_table.find("].[");
    if (separator == std::string::npos) {
      const auto table = strip_brackets(qualified_table);
      if (!table) {
        throw_bad_format(qualified_table);
      }
      result.table_name = *table;
    } else {
      const auto schema =
          strip_brackets(qualified_table.substr(0, separator + 1));
      const auto table = strip_brackets(qualified_table.substr(separator + 2));
      if (!schema || !table) {
        throw_bad_format(qualified_table);
      }
      result.schema_name = *schema;
      result.table_name = *table;
    }
  }

  validate_identifiers(result);
  return result;
}

std::string qualify_table_name(const std::optional<std::string> &schema,
                               const std::string &table) {
  if (has_schema(schema)) {
    return *schema + "." + table;
  }
  return table;
}

std::string table_def::to_escaped_string(const SqlDialect &dialect) const {
  if (has_schema(schema_name)) {
    return dialect.quote_identifier(*schema_name) + "." +
           dialect.quote_identifier(table_name);
  }
  return dialect.quote_identifier(table_name);
}

std::string table_def::to_string() const {
  return qualify_table_name(schema_name, table_name);
}

std::string table_def::effective_schema(const SqlDialect &dialect) const {
  return has_schema(schema_name) ? *schema_name : dialect.default_schema();
}
