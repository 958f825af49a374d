#pragma once

#include "scalar_type.hpp"

#include <optional>
#include <string>
#include <utility>

/// Default value of a column. An expression is emitted into the DDL as is,
/// so the caller is responsible for it being valid SQL (e.g. "cuid()" or
/// "now()"). A literal is rendered and escaped by the dialect according to the
/// column's scalar type.
struct default_value {
  enum class Kind { Expression, Literal };

  Kind kind;
  std::string value;

  static default_value expression(std::string sql) {
    return default_value{Kind::Expression, std::move(sql)};
  }

  static default_value literal(std::string raw) {
    return default_value{Kind::Literal, std::move(raw)};
  }

  bool operator==(const default_value &other) const = default;
};

/// One field of a schema model, as handed over by the datamodel reader.
struct field_spec {
  std::string name;
  bool is_required = false;
  bool is_list = false;
  ScalarType type = ScalarType::String;
  /// Carried through for callers; does not change the emitted definition.
  bool is_auto_generated = false;
  std::optional<default_value> default_val;
};
