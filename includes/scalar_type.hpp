#pragma once

#include <array>
#include <string>
#include <string_view>

/// Logical, database-agnostic field types of the schema layer.
enum class ScalarType {
  String,
  Boolean,
  Int,
  Float,
  Cuid,
  Enum,
  Json,
  DateTime,
  UUID
};

inline constexpr std::array<ScalarType, 9> ALL_SCALAR_TYPES = {
    ScalarType::String, ScalarType::Boolean, ScalarType::Int,
    ScalarType::Float,  ScalarType::Cuid,    ScalarType::Enum,
    ScalarType::Json,   ScalarType::DateTime, ScalarType::UUID};

/// Schema-layer name of the type, e.g. "DateTime". Throws
/// cd_error::UnsupportedScalarType for values outside the enumeration.
std::string_view scalar_type_name(ScalarType type);

/// Inverse of scalar_type_name. "ID" is accepted as an alias of Cuid.
ScalarType parse_scalar_type(std::string_view name);

/// Placeholder used when reporting a value that is not a member of
/// ScalarType, e.g. "ScalarType(42)".
std::string describe_unknown_scalar_type(ScalarType type);
