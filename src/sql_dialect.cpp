#include "sql_dialect.hpp"
#include "cd_error.hpp"
#include "duckdb.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

using duckdb::KeywordHelper;

namespace {
[[noreturn]] void throw_unsupported(ScalarType type) {
  throw cd_error::UnsupportedScalarType(describe_unknown_scalar_type(type));
}

// DuckDB rejects DECIMAL widths above 38
constexpr std::uint8_t DUCKDB_DECIMAL_WIDTH = 38;
constexpr std::uint8_t DUCKDB_DECIMAL_SCALE = 18;

duckdb::LogicalType to_duckdb_type(ScalarType type) {
  switch (type) {
  case ScalarType::String:
  case ScalarType::Cuid:
  case ScalarType::Enum:
  case ScalarType::Json:
    return duckdb::LogicalType::VARCHAR;
  case ScalarType::Boolean:
    return duckdb::LogicalType::BOOLEAN;
  case ScalarType::Int:
    return duckdb::LogicalType::INTEGER;
  case ScalarType::Float:
    return duckdb::LogicalType::DECIMAL(DUCKDB_DECIMAL_WIDTH,
                                        DUCKDB_DECIMAL_SCALE);
  case ScalarType::DateTime:
    return duckdb::LogicalType::TIMESTAMP_MS;
  case ScalarType::UUID:
    return duckdb::LogicalType::UUID;
  }
  throw_unsupported(type);
}
} // namespace

std::string SqlDialect::quote_literal(const std::string &value) const {
  return KeywordHelper::WriteQuoted(value, '\'');
}

// Postgres

std::string
PostgresDialect::escape_identifier(const std::string &identifier) const {
  return KeywordHelper::WriteQuoted(identifier, '"');
}

std::string PostgresDialect::sql_type(bool is_list, ScalarType type) const {
  if (is_list) {
    return "text";
  }
  switch (type) {
  case ScalarType::String:
    return "text";
  case ScalarType::Boolean:
    return "boolean";
  case ScalarType::Int:
    return "int";
  case ScalarType::Float:
    return "Decimal(65,30)";
  case ScalarType::Cuid:
    return "varchar (25)";
  case ScalarType::Enum:
    return "text";
  case ScalarType::Json:
    return "text";
  case ScalarType::DateTime:
    return "timestamp (3)";
  case ScalarType::UUID:
    return "uuid";
  }
  throw_unsupported(type);
}

// MySQL

std::string MySqlDialect::escape_identifier(const std::string &identifier) const {
  return KeywordHelper::WriteQuoted(identifier, '`');
}

std::string MySqlDialect::sql_type(bool is_list, ScalarType type) const {
  if (is_list) {
    return "mediumtext";
  }
  switch (type) {
  case ScalarType::String:
    return "mediumtext";
  case ScalarType::Boolean:
    return "boolean";
  case ScalarType::Int:
    return "int";
  case ScalarType::Float:
    return "Decimal(65,30)";
  case ScalarType::Cuid:
    return "char(25)";
  case ScalarType::Enum:
    // 191 characters keep the column indexable under utf8mb4
    return "varchar(191)";
  case ScalarType::Json:
    return "mediumtext";
  case ScalarType::DateTime:
    return "datetime(3)";
  case ScalarType::UUID:
    return "char(36)";
  }
  throw_unsupported(type);
}

std::string MySqlDialect::quote_literal(const std::string &value) const {
  // backslash is an escape character in MySQL string literals unless
  // NO_BACKSLASH_ESCAPES is set
  std::string escaped;
  escaped.reserve(value.size());
  for (const char c : value) {
    if (c == '\\') {
      escaped += "\\\\";
    } else {
      escaped += c;
    }
  }
  return KeywordHelper::WriteQuoted(escaped, '\'');
}

std::string MySqlDialect::default_literal(const std::string &column_type,
                                          const std::string &literal) const {
  const bool is_text_or_blob =
      column_type.ends_with("text") || column_type.ends_with("blob");
  if (is_text_or_blob) {
    return "(" + literal + ")";
  }
  return literal;
}

// SQLite

std::string
SqliteDialect::escape_identifier(const std::string &identifier) const {
  return KeywordHelper::WriteQuoted(identifier, '"');
}

std::string SqliteDialect::sql_type(bool is_list, ScalarType type) const {
  if (is_list) {
    return "text";
  }
  switch (type) {
  case ScalarType::String:
  case ScalarType::Enum:
  case ScalarType::Json:
    return "text";
  case ScalarType::Boolean:
    return "boolean";
  case ScalarType::Int:
    return "int";
  case ScalarType::Float:
    return "Decimal(65,30)";
  case ScalarType::Cuid:
    return "varchar (25)";
  case ScalarType::DateTime:
    return "datetime(3)";
  case ScalarType::UUID:
    return "char(36)";
  }
  throw_unsupported(type);
}

// DuckDB

std::string
DuckDbDialect::escape_identifier(const std::string &identifier) const {
  return KeywordHelper::WriteQuoted(identifier, '"');
}

std::string DuckDbDialect::sql_type(bool is_list, ScalarType type) const {
  if (is_list) {
    return duckdb::LogicalType(duckdb::LogicalTypeId::VARCHAR).ToString();
  }
  return to_duckdb_type(type).ToString();
}

std::shared_ptr<const SqlDialect> make_dialect(const std::string &name) {
  if (name == "postgres" || name == "postgresql") {
    return std::make_shared<PostgresDialect>();
  }
  if (name == "mysql") {
    return std::make_shared<MySqlDialect>();
  }
  if (name == "sqlite") {
    return std::make_shared<SqliteDialect>();
  }
  if (name == "duckdb") {
    return std::make_shared<DuckDbDialect>();
  }
  throw std::invalid_argument("Unknown SQL dialect <" + name + ">");
}
