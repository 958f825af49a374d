#include "column_compiler.hpp"
#include "cd_error.hpp"
#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

bool is_digit(const char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Consumes a run of digits starting at pos and returns how many were read.
size_t skip_digits(const std::string &str, size_t &pos) {
  const size_t start = pos;
  while (pos < str.size() && is_digit(str[pos])) {
    ++pos;
  }
  return pos - start;
}

void skip_sign(const std::string &str, size_t &pos) {
  if (pos < str.size() && (str[pos] == '+' || str[pos] == '-')) {
    ++pos;
  }
}

bool is_integer_literal(const std::string &str) {
  size_t pos = 0;
  skip_sign(str, pos);
  return skip_digits(str, pos) > 0 && pos == str.size();
}

// [+-] digits [. digits] [e [+-] digits], or [+-] . digits [...]
bool is_decimal_literal(const std::string &str) {
  size_t pos = 0;
  skip_sign(str, pos);
  size_t mantissa_digits = skip_digits(str, pos);
  if (pos < str.size() && str[pos] == '.') {
    ++pos;
    mantissa_digits += skip_digits(str, pos);
  }
  if (mantissa_digits == 0) {
    return false;
  }
  if (pos < str.size() && (str[pos] == 'e' || str[pos] == 'E')) {
    ++pos;
    skip_sign(str, pos);
    if (skip_digits(str, pos) == 0) {
      return false;
    }
  }
  return pos == str.size();
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

} // namespace

CdColumnCompiler::CdColumnCompiler(std::shared_ptr<const SqlDialect> dialect_,
                                   std::shared_ptr<cdlog::CdLog> logger_)
    : dialect(std::move(dialect_)), logger(std::move(logger_)) {
  if (!dialect) {
    throw std::invalid_argument("CdColumnCompiler requires a dialect");
  }
  if (!logger) {
    throw std::invalid_argument("CdColumnCompiler requires a logger");
  }
  logger->info("column compiler bound to dialect " + dialect->name());
}

std::string CdColumnCompiler::sql_type(bool is_list, ScalarType type) const {
  return dialect->sql_type(is_list, type);
}

std::string
CdColumnCompiler::render_default(const std::string &name, bool is_list,
                                 ScalarType type,
                                 const default_value &default_val) const {
  if (default_val.kind == default_value::Kind::Expression) {
    return default_val.value;
  }

  // lists are stored as serialized text, so their defaults are text too
  if (is_list) {
    return dialect->quote_literal(default_val.value);
  }

  switch (type) {
  case ScalarType::Boolean: {
    const auto lowered = to_lower(default_val.value);
    if (lowered != "true" && lowered != "false") {
      throw cd_error::InvalidDefaultValue(name, default_val.value,
                                          "expected true or false");
    }
    return lowered;
  }
  case ScalarType::Int:
    if (!is_integer_literal(default_val.value)) {
      throw cd_error::InvalidDefaultValue(name, default_val.value,
                                          "expected an integer");
    }
    return default_val.value;
  case ScalarType::Float:
    if (!is_decimal_literal(default_val.value)) {
      throw cd_error::InvalidDefaultValue(name, default_val.value,
                                          "expected a decimal number");
    }
    return default_val.value;
  case ScalarType::String:
  case ScalarType::Cuid:
  case ScalarType::Enum:
  case ScalarType::Json:
  case ScalarType::DateTime:
  case ScalarType::UUID:
    return dialect->quote_literal(default_val.value);
  }
  throw cd_error::UnsupportedScalarType(describe_unknown_scalar_type(type));
}

std::string
CdColumnCompiler::compile(const std::string &name, bool is_required,
                          bool is_list, ScalarType type,
                          bool /* is_auto_generated */,
                          const std::optional<default_value> &default_val) const {
  try {
    const auto column_type = sql_type(is_list, type);
    std::ostringstream out;
    out << dialect->escape_identifier(name) << " " << column_type << " "
        << (is_required ? "NOT NULL" : "NULL");
    if (default_val.has_value()) {
      auto rendered = render_default(name, is_list, type, default_val.value());
      if (default_val->kind == default_value::Kind::Literal) {
        rendered = dialect->default_literal(column_type, rendered);
      }
      out << " DEFAULT " << rendered;
    }
    return out.str();
  } catch (const cd_error::UnsupportedScalarType &ex) {
    logger->severe("Could not compile column <" + name + "> for dialect " +
                   dialect->name() + ": " + ex.what());
    throw;
  } catch (const cd_error::InvalidDefaultValue &ex) {
    logger->severe("Could not compile column <" + name + "> for dialect " +
                   dialect->name() + ": " + ex.what());
    throw;
  }
}

std::string CdColumnCompiler::compile(const field_spec &field) const {
  return compile(field.name, field.is_required, field.is_list, field.type,
                 field.is_auto_generated, field.default_val);
}

CdColumnCompiler
make_column_compiler(const std::map<std::string, std::string> &properties,
                     std::shared_ptr<cdlog::CdLog> logger) {
  if (!logger) {
    throw std::invalid_argument("make_column_compiler requires a logger");
  }
  const auto dialect_name =
      config::find_property(properties, config::PROP_DIALECT);
  if (config::find_optional_property(properties, config::PROP_LOG_TO_STDOUT)
          .has_value()) {
    logger->set_log_to_stdout(config::find_bool_property(
        properties, config::PROP_LOG_TO_STDOUT, true));
  }
  return CdColumnCompiler(make_dialect(dialect_name), std::move(logger));
}
