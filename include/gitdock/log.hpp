#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace gitdock {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

std::optional<LogLevel> parse_log_level(std::string_view text);

// Process-wide logger. Each call writes one whole line to stderr, so lines
// from concurrent sessions never interleave.
class Logger {
public:
  static Logger &instance();

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;

  void error(const std::string &msg);
  void warn(const std::string &msg);
  void info(const std::string &msg);
  void debug(const std::string &msg);

private:
  Logger();
  void write(LogLevel at, std::string_view tag, const std::string &msg);

  mutable std::mutex mu_;
  LogLevel level_;
};

namespace log {
inline void error(const std::string &msg) { Logger::instance().error(msg); }
inline void warn(const std::string &msg) { Logger::instance().warn(msg); }
inline void info(const std::string &msg) { Logger::instance().info(msg); }
inline void debug(const std::string &msg) { Logger::instance().debug(msg); }
} // namespace log

} // namespace gitdock
