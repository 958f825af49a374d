#include "scalar_type.hpp"
#include "cd_error.hpp"

#include <string>
#include <string_view>

std::string describe_unknown_scalar_type(ScalarType type) {
  return "ScalarType(" + std::to_string(static_cast<int>(type)) + ")";
}

std::string_view scalar_type_name(ScalarType type) {
  switch (type) {
  case ScalarType::String:
    return "String";
  case ScalarType::Boolean:
    return "Boolean";
  case ScalarType::Int:
    return "Int";
  case ScalarType::Float:
    return "Float";
  case ScalarType::Cuid:
    return "Cuid";
  case ScalarType::Enum:
    return "Enum";
  case ScalarType::Json:
    return "Json";
  case ScalarType::DateTime:
    return "DateTime";
  case ScalarType::UUID:
    return "UUID";
  }
  throw cd_error::UnsupportedScalarType(describe_unknown_scalar_type(type));
}

ScalarType parse_scalar_type(std::string_view name) {
  for (const auto type : ALL_SCALAR_TYPES) {
    if (scalar_type_name(type) == name) {
      return type;
    }
  }
  if (name == "ID") {
    return ScalarType::Cuid;
  }
  throw cd_error::UnsupportedScalarType(std::string(name));
}
