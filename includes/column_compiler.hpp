#pragma once

#include "cd_logging.hpp"
#include "schema_types.hpp"
#include "sql_dialect.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

/// Compiles a field description into a column definition fragment, e.g.
/// `"age" int NOT NULL`, for the dialect it is bound to. The fragment is meant
/// to be embedded into CREATE TABLE or ALTER TABLE ... ADD COLUMN statements.
/// compile() is const and touches no shared mutable state apart from the
/// logger, which is synchronized, so a compiler can be shared between threads.
class CdColumnCompiler {
public:
  CdColumnCompiler(std::shared_ptr<const SqlDialect> dialect_,
                   std::shared_ptr<cdlog::CdLog> logger_);

  std::string compile(const std::string &name, bool is_required, bool is_list,
                      ScalarType type, bool is_auto_generated = false,
                      const std::optional<default_value> &default_val =
                          std::nullopt) const;

  std::string compile(const field_spec &field) const;

  std::string sql_type(bool is_list, ScalarType type) const;

  const SqlDialect &get_dialect() const { return *dialect; }

private:
  std::string render_default(const std::string &name, bool is_list,
                             ScalarType type,
                             const default_value &default_val) const;

  std::shared_ptr<const SqlDialect> dialect;
  std::shared_ptr<cdlog::CdLog> logger;
};

/// Builds a compiler from configuration properties (see config.hpp). The
/// dialect property is required. log_to_stdout, when present, switches the
/// logger's stdout output; otherwise the logger is left as it is.
CdColumnCompiler
make_column_compiler(const std::map<std::string, std::string> &properties,
                     std::shared_ptr<cdlog::CdLog> logger);
