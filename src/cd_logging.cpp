#include "cd_logging.hpp"

#include <cstdio>
#include <iostream>
#include <string>

namespace cdlog {

namespace {
// Escapes a string for use inside a JSON string literal
std::string escape_json(const std::string &str) {
  std::string result;
  result.reserve(str.size());
  for (const char c : str) {
    switch (c) {
    case '\\':
      result += "\\\\";
      break;
    case '"':
      result += "\\\"";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buffer[7];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned int>(static_cast<unsigned char>(c)));
        result += buffer;
      } else {
        result += c;
      }
    }
  }
  return result;
}
} // namespace

void CdLog::log_to_stdout(const std::string &level,
                          const std::string &message) {
  std::cout << "{\"level\":\"" << escape_json(level) << "\","
            << "\"message\":\"" << escape_json(message) << "\","
            << "\"message-origin\":\"coldef\"}" << std::endl;
}

void CdLog::log(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex);
  if (stdout_enabled) {
    log_to_stdout(level, message);
  }

  buffered_messages.emplace_back(level, message);
  if (buffered_messages.size() > MAX_BUFFERED_MESSAGES) {
    buffered_messages.pop_front();
  }
}

void CdLog::info(const std::string &message) { log("INFO", message); }

void CdLog::warning(const std::string &message) { log("WARNING", message); }

void CdLog::severe(const std::string &message) { log("SEVERE", message); }

void CdLog::set_log_to_stdout(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex);
  stdout_enabled = enabled;
}

std::vector<std::pair<std::string, std::string>>
CdLog::recent_messages() const {
  std::lock_guard<std::mutex> lock(mutex);
  return std::vector<std::pair<std::string, std::string>>(
      buffered_messages.begin(), buffered_messages.end());
}

} // namespace cdlog
