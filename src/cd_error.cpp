#include "cd_error.hpp"

namespace cd_error {

UnsupportedScalarType::UnsupportedScalarType(const std::string &type_identifier)
    : runtime_error("No SQL type mapping for scalar type <" + type_identifier +
                    ">"),
      type_id(type_identifier) {}

InvalidDefaultValue::InvalidDefaultValue(const std::string &column_name,
                                         const std::string &value,
                                         const std::string &reason)
    : runtime_error("Invalid default value <" + value + "> for column <" +
                    column_name + ">: " + reason),
      column(column_name), raw_value(value) {}

} // namespace cd_error
