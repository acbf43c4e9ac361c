#pragma once
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>

namespace tyredeg {

enum class LogLevel : int {
  Info = 0,
  Warn = 1,
  Error = 2,
  Off = 3
};

const char* log_level_name(LogLevel level);

// Process-wide leveled logger. Writes "[LEVEL] message" lines to stderr
// unless a sink is installed (tests capture output that way).
class Logger {
public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static Logger& instance();

  void set_level(LogLevel level);
  LogLevel level() const;

  // Empty sink restores the stderr default.
  void set_sink(Sink sink);

  void info(const char* message)  { log(LogLevel::Info, message); }
  void warn(const char* message)  { log(LogLevel::Warn, message); }
  void error(const char* message) { log(LogLevel::Error, message); }

  template <typename... Args>
  void info(const char* format, Args... args)  { log_formatted(LogLevel::Info, format, args...); }
  template <typename... Args>
  void warn(const char* format, Args... args)  { log_formatted(LogLevel::Warn, format, args...); }
  template <typename... Args>
  void error(const char* format, Args... args) { log_formatted(LogLevel::Error, format, args...); }

private:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  template <typename... Args>
  void log_formatted(LogLevel level, const char* format, Args... args) {
    if (!enabled(level)) return;
    char buffer[1024];
    std::snprintf(buffer, sizeof(buffer), format, args...);
    log(level, buffer);
  }

  bool enabled(LogLevel level) const;
  void log(LogLevel level, const char* message);

  mutable std::mutex mu_;
  LogLevel level_{LogLevel::Info};
  Sink sink_{};
};

} // namespace tyredeg

#define TYREDEG_LOG_INFO(...)  ::tyredeg::Logger::instance().info(__VA_ARGS__)
#define TYREDEG_LOG_WARN(...)  ::tyredeg::Logger::instance().warn(__VA_ARGS__)
#define TYREDEG_LOG_ERROR(...) ::tyredeg::Logger::instance().error(__VA_ARGS__)
