#include "gitdock/log.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>

namespace gitdock {

std::optional<LogLevel> parse_log_level(std::string_view v) {
  if (v == "debug" || v == "3") return LogLevel::Debug;
  if (v == "info" || v == "2") return LogLevel::Info;
  if (v == "warn" || v == "1") return LogLevel::Warn;
  if (v == "error" || v == "0") return LogLevel::Error;
  return std::nullopt;
}

namespace {

LogLevel env_log_level() {
  const char *env = std::getenv("GITDOCK_LOG");
  if (env == nullptr) {
    return LogLevel::Info;
  }
  return parse_log_level(env).value_or(LogLevel::Info);
}

} // namespace

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

Logger::Logger() : level_(env_log_level()) {}

void Logger::set_level(LogLevel level) {
  std::lock_guard lock(mu_);
  level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard lock(mu_);
  return level_;
}

void Logger::write(LogLevel at, std::string_view tag, const std::string &msg) {
  std::lock_guard lock(mu_);
  if (level_ < at) {
    return;
  }
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);
  std::cerr << stamp << " [" << tag << "] " << msg << "\n";
}

void Logger::error(const std::string &msg) { write(LogLevel::Error, "error", msg); }
void Logger::warn(const std::string &msg) { write(LogLevel::Warn, "warn ", msg); }
void Logger::info(const std::string &msg) { write(LogLevel::Info, "info ", msg); }
void Logger::debug(const std::string &msg) { write(LogLevel::Debug, "debug", msg); }

} // namespace gitdock
