#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cdlog {

class CdLog {
public:
  void log(const std::string &level, const std::string &message);

  void info(const std::string &message);
  void warning(const std::string &message);
  void severe(const std::string &message);

  void set_log_to_stdout(bool enabled);

  /// Most recent (level, message) pairs, oldest first.
  std::vector<std::pair<std::string, std::string>> recent_messages() const;

private:
  static constexpr size_t MAX_BUFFERED_MESSAGES = 64;

  void log_to_stdout(const std::string &level, const std::string &message);

  mutable std::mutex mutex;
  bool stdout_enabled = true;
  std::deque<std::pair<std::string, std::string>> buffered_messages;
};

} // namespace cdlog
