#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace config {
inline constexpr const char *PROP_DIALECT = "dialect";
inline constexpr const char *PROP_LOG_TO_STDOUT = "log_to_stdout";

template <typename MapLike>
std::string find_property(const MapLike &config,
                          const std::string &property_name) {
  const auto it = config.find(property_name);
  if (it == config.end()) {
    throw std::invalid_argument("Missing property " + property_name);
  }
  return it->second;
}

template <typename MapLike>
std::optional<std::string>
find_optional_property(const MapLike &config,
                       const std::string &property_name) {
  const auto it = config.find(property_name);
  if (it == config.end()) {
    return std::nullopt;
  }
  return it->second;
}

/// Accepts "true" and "false" only; a missing property yields fallback.
template <typename MapLike>
bool find_bool_property(const MapLike &config, const std::string &property_name,
                        const bool fallback) {
  const auto value = find_optional_property(config, property_name);
  if (!value.has_value()) {
    return fallback;
  }
  if (*value == "true") {
    return true;
  }
  if (*value == "false") {
    return false;
  }
  throw std::invalid_argument("Property " + property_name +
                              " must be \"true\" or \"false\", got \"" +
                              *value + "\"");
}
} // namespace config
