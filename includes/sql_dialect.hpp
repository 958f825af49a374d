#pragma once

#include "scalar_type.hpp"

#include <memory>
#include <string>

/// Dialect-specific pieces of column DDL: identifier quoting, the scalar type
/// table and literal quoting. Implementations hold no mutable state.
class SqlDialect {
public:
  virtual ~SqlDialect() = default;

  virtual std::string name() const = 0;

  /// Quoted identifier with embedded quote characters doubled. Deterministic
  /// for a given input.
  virtual std::string escape_identifier(const std::string &identifier) const = 0;

  /// SQL type for a field. List fields are stored as serialized text whatever
  /// their scalar type. Throws cd_error::UnsupportedScalarType for values
  /// outside ScalarType.
  virtual std::string sql_type(bool is_list, ScalarType type) const = 0;

  /// Single-quoted string literal.
  virtual std::string quote_literal(const std::string &value) const;

  /// Final form of a rendered literal default on a column of the given SQL
  /// type. Most dialects take the literal as is.
  virtual std::string default_literal(const std::string & /* column_type */,
                                      const std::string &literal) const {
    return literal;
  }
};

class PostgresDialect final : public SqlDialect {
public:
  std::string name() const override { return "postgres"; }
  std::string escape_identifier(const std::string &identifier) const override;
  std::string sql_type(bool is_list, ScalarType type) const override;
};

class MySqlDialect final : public SqlDialect {
public:
  std::string name() const override { return "mysql"; }
  std::string escape_identifier(const std::string &identifier) const override;
  std::string sql_type(bool is_list, ScalarType type) const override;
  std::string quote_literal(const std::string &value) const override;
  /// TEXT and BLOB columns only accept defaults in expression form,
  /// `DEFAULT ('...')` (MySQL 8.0.13 and later).
  std::string default_literal(const std::string &column_type,
                              const std::string &literal) const override;
};

class SqliteDialect final : public SqlDialect {
public:
  std::string name() const override { return "sqlite"; }
  std::string escape_identifier(const std::string &identifier) const override;
  std::string sql_type(bool is_list, ScalarType type) const override;
};

/// Type names come from duckdb::LogicalType so that they match what DuckDB
/// reports back in duckdb_columns().
class DuckDbDialect final : public SqlDialect {
public:
  std::string name() const override { return "duckdb"; }
  std::string escape_identifier(const std::string &identifier) const override;
  std::string sql_type(bool is_list, ScalarType type) const override;
};

/// Accepts "postgres" (alias "postgresql"), "mysql", "sqlite" and "duckdb".
/// Throws std::invalid_argument for anything else.
std::shared_ptr<const SqlDialect> make_dialect(const std::string &name);
