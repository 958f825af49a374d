#pragma once

#include <stdexcept>
#include <string>

namespace cd_error {

/// Raised when a scalar type has no entry in a dialect's type table, or when
/// a schema-layer type name does not name a known scalar type. Callers should
/// report it as a schema-authoring error; it is never retryable.
class UnsupportedScalarType : public std::runtime_error {
public:
  explicit UnsupportedScalarType(const std::string &type_identifier);

  const std::string &type_identifier() const { return type_id; }

private:
  std::string type_id;
};

/// Raised when a literal default value cannot be rendered for the column's
/// scalar type, e.g. "abc" as an Int default.
class InvalidDefaultValue : public std::runtime_error {
public:
  InvalidDefaultValue(const std::string &column_name,
                      const std::string &value, const std::string &reason);

  const std::string &column_name() const { return column; }
  const std::string &value() const { return raw_value; }

private:
  std::string column;
  std::string raw_value;
};

} // namespace cd_error
